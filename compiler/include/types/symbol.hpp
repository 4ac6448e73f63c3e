//! # Declared Entities
//!
//! Symbols are the member declarations the collector enumerates, classes are
//! the declarations that own them, and denotations are the concrete
//! signatures a symbol shows through one base class.
//!
//! ## Ownership
//!
//! A symbol table owns every `Symbol` and `ClassSymbol`; everything else
//! holds `const` pointers into it. Two symbols are the same member iff they
//! are the same object.
//!
//! ## Flags
//!
//! `Symbol::flags` is `std::nullopt` while a declaration's modifiers are not
//! known yet. Every flag test on such a symbol answers conservatively (see
//! `lacks()`), so an unknown symbol never slips through a filter.

#ifndef MEMSCOPE_TYPES_SYMBOL_HPP
#define MEMSCOPE_TYPES_SYMBOL_HPP

#include "types/type.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace memscope::types {

/// What a declaration introduces. Closed set; switch on it exhaustively.
enum class SymbolKind {
    Term,  ///< A value: `val`, `var`, `def`.
    Type,  ///< A type member or alias: `type T`.
    Class, ///< A class, trait or module class declaration.
};

/// Origin and visibility modifiers of a declaration.
enum class SymbolFlag : uint32_t {
    Synthetic = 1u << 0,   ///< Generated by the compiler, not written by the user.
    Private = 1u << 1,     ///< `private`: visible inside the owner only.
    Protected = 1u << 2,   ///< `protected`: visible inside the owner and subclasses.
    Constructor = 1u << 3, ///< A constructor of the owner.
    Module = 1u << 4,      ///< A module (singleton object) class.
};

/// Bit set of `SymbolFlag`.
class SymbolFlags {
public:
    constexpr SymbolFlags() = default;
    constexpr SymbolFlags(SymbolFlag flag) : bits_(static_cast<uint32_t>(flag)) {}

    [[nodiscard]] constexpr auto has(SymbolFlag flag) const -> bool {
        return (bits_ & static_cast<uint32_t>(flag)) != 0;
    }

    constexpr auto operator|=(SymbolFlags other) -> SymbolFlags& {
        bits_ |= other.bits_;
        return *this;
    }

    [[nodiscard]] constexpr auto bits() const -> uint32_t {
        return bits_;
    }

    [[nodiscard]] constexpr auto operator==(const SymbolFlags& other) const -> bool = default;

private:
    uint32_t bits_ = 0;
};

[[nodiscard]] constexpr auto operator|(SymbolFlags a, SymbolFlags b) -> SymbolFlags {
    return a |= b;
}

[[nodiscard]] constexpr auto operator|(SymbolFlag a, SymbolFlag b) -> SymbolFlags {
    return SymbolFlags(a) | SymbolFlags(b);
}

/// A named member declaration owned by exactly one class.
struct Symbol {
    std::string name;                      ///< Declared name.
    SymbolKind kind;                       ///< Term, type or class declaration.
    std::optional<SymbolFlags> flags;      ///< Modifiers; nullopt while unknown.
    const ClassSymbol* owner = nullptr;    ///< Enclosing class.
    std::vector<TypePtr> signatures;       ///< One entry per overload alternative.
    const ClassSymbol* declared = nullptr; ///< The class a `Class` symbol declares.
    bool valid = true;                     ///< Cleared when the declaration is dropped.

    [[nodiscard]] auto exists() const -> bool {
        return valid;
    }

    [[nodiscard]] auto is_term() const -> bool {
        return kind == SymbolKind::Term;
    }

    /// Type members and classes both live in the type namespace.
    [[nodiscard]] auto is_type() const -> bool {
        return kind == SymbolKind::Type || kind == SymbolKind::Class;
    }

    [[nodiscard]] auto is_class() const -> bool {
        return kind == SymbolKind::Class;
    }

    /// True iff the flags are known and include `flag`.
    [[nodiscard]] auto is(SymbolFlag flag) const -> bool {
        return flags && flags->has(flag);
    }

    /// True iff the flags are known and do not include `flag`.
    [[nodiscard]] auto lacks(SymbolFlag flag) const -> bool {
        return flags && !flags->has(flag);
    }
};

/// A class, trait or module class declaration.
///
/// `base_classes` is the linearization of the class: the class itself first,
/// then every ancestor once, most derived first.
struct ClassSymbol {
    std::string name;                             ///< Class name.
    std::vector<const ClassSymbol*> parents;      ///< Direct parents in declaration order.
    std::vector<const Symbol*> decls;             ///< Members declared directly in the class.
    std::vector<const ClassSymbol*> base_classes; ///< Linearization, most derived first.
    bool is_module = false;                       ///< True for singleton objects.
};

/// One signature of a symbol as seen through a base class (a member
/// occurrence). Overloaded symbols have one denotation per alternative.
struct Denotation {
    const Symbol* symbol = nullptr;      ///< The declaration; may be null.
    TypePtr info;                        ///< The signature of this alternative.
    const ClassSymbol* prefix = nullptr; ///< Base class the member was reached through.
    size_t alternative = 0;              ///< Index into `symbol->signatures`.

    [[nodiscard]] auto exists() const -> bool {
        return symbol != nullptr && symbol->exists();
    }
};

/// `name: signature` (or just the name when there is no signature).
[[nodiscard]] auto denotation_to_string(const Denotation& denot) -> std::string;

} // namespace memscope::types

#endif // MEMSCOPE_TYPES_SYMBOL_HPP
