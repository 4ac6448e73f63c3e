//! # Common Definitions
//!
//! The result type fallible memscope operations return, and the ownership
//! alias the symbol table stores its declarations in.
//!
//! Total queries (the collectors and their predicates) return plain values.
//! Definitions and configuration parsing can fail on user input and return
//! `Result<T, std::string>` with a readable message instead of throwing.

#ifndef MEMSCOPE_COMMON_HPP
#define MEMSCOPE_COMMON_HPP

#include <memory>
#include <string>
#include <utility>
#include <variant>

namespace memscope {

/// Either a value or an error.
///
/// ```cpp
/// auto policy = FilterPolicy::parse("term,applied");
/// if (is_err(policy))
///     return unwrap_err(policy);
/// auto members = collect_symbols(type, unwrap(policy), ctx);
/// ```
template <typename T, typename E = std::string> using Result = std::variant<T, E>;

template <typename T, typename E>
[[nodiscard]] constexpr auto is_ok(const Result<T, E>& result) -> bool {
    return std::holds_alternative<T>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto is_err(const Result<T, E>& result) -> bool {
    return std::holds_alternative<E>(result);
}

/// The value. Throws `std::bad_variant_access` on an error.
template <typename T, typename E> [[nodiscard]] constexpr auto unwrap(Result<T, E>& result) -> T& {
    return std::get<T>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap(const Result<T, E>& result) -> const T& {
    return std::get<T>(result);
}

/// The error. Throws `std::bad_variant_access` on a value.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(Result<T, E>& result) -> E& {
    return std::get<E>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(const Result<T, E>& result) -> const E& {
    return std::get<E>(result);
}

/// Sole owner of a declaration.
template <typename T> using Box = std::unique_ptr<T>;

template <typename T, typename... Args> [[nodiscard]] auto make_box(Args&&... args) -> Box<T> {
    return std::make_unique<T>(std::forward<Args>(args)...);
}

} // namespace memscope

#endif // MEMSCOPE_COMMON_HPP
