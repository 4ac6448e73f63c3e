//! # Filter Policy
//!
//! The single configuration value both collectors take. It says which
//! namespace to look in (terms or types) and which otherwise hidden members
//! to let through.
//!
//! ## Text Form
//!
//! A policy can be read from a comma-separated list of tokens:
//!
//! | Token          | Effect                                     |
//! |----------------|--------------------------------------------|
//! | `term`         | collect term members (default)             |
//! | `type`         | collect type members                       |
//! | `applied`      | the access is followed by an argument list |
//! | `private`      | include private members                    |
//! | `synthetic`    | include compiler-generated members         |
//! | `constructors` | include constructors                       |
//! | `accessible`   | filter by accessibility from the site      |
//!
//! The call site itself has no text form; attach it with `with_site()`.

#ifndef MEMSCOPE_MEMBERS_FILTER_POLICY_HPP
#define MEMSCOPE_MEMBERS_FILTER_POLICY_HPP

#include "common.hpp"
#include "types/type.hpp"

#include <string>
#include <string_view>

namespace memscope::members {

/// Which namespace a lookup collects from.
enum class MemberKind {
    Term, ///< Values, methods and (when applied) constructor proxies.
    Type, ///< Type members and classes.
};

/// Which members qualify for collection.
///
/// Every option except `kind` defaults to off, so `FilterPolicy{}` collects
/// public, user-written, non-constructor term members without looking at
/// accessibility.
///
/// # Example
///
/// ```cpp
/// auto policy = FilterPolicy{.kind = MemberKind::Term, .is_applied = true}.with_site(this_type);
/// ```
struct FilterPolicy {
    MemberKind kind = MemberKind::Term;
    bool is_applied = false;
    bool include_private = false;
    bool include_synthetic = false;
    bool include_constructors = false;
    bool check_accessibility = false;
    /// Type of the code doing the access. Null or `no_type()` means absent,
    /// which disables the accessibility check.
    types::TypePtr site;

    [[nodiscard]] static auto term_members() -> FilterPolicy {
        return FilterPolicy{};
    }

    [[nodiscard]] static auto type_members() -> FilterPolicy {
        return FilterPolicy{.kind = MemberKind::Type};
    }

    [[nodiscard]] auto wants_type() const -> bool {
        return kind == MemberKind::Type;
    }

    /// True when accessibility is checked against an actual site.
    [[nodiscard]] auto has_site() const -> bool {
        return !types::is_absent(site);
    }

    /// Copy of this policy that checks accessibility from `call_site`.
    [[nodiscard]] auto with_site(types::TypePtr call_site) const -> FilterPolicy {
        FilterPolicy copy = *this;
        copy.site = std::move(call_site);
        copy.check_accessibility = true;
        return copy;
    }

    /// Parses the text form. Unknown tokens and `term,type` are errors.
    [[nodiscard]] static auto parse(std::string_view spec) -> Result<FilterPolicy, std::string>;
};

/// Canonical text form, e.g. "term,applied,private". Omits the site.
[[nodiscard]] auto to_string(const FilterPolicy& policy) -> std::string;

} // namespace memscope::members

#endif // MEMSCOPE_MEMBERS_FILTER_POLICY_HPP
