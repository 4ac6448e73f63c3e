//! # Symbol Table
//!
//! An in-memory class universe implementing `MemberContext`. It owns every
//! class and member declared through it and hands out stable `const`
//! pointers.
//!
//! ## Linearization
//!
//! Base classes are computed when a class is defined:
//!
//! ```text
//! L(C) = C, L(Pn) +> ... +> L(P1)
//! ```
//!
//! where `a +> b` is the elements of `a` missing from `b`, followed by `b`.
//! Parents must be defined before their subclasses, so the class graph is
//! acyclic by construction.
//!
//! ## Accessibility
//!
//! | Member      | Accessible from a site whose class is ... |
//! |-------------|-------------------------------------------|
//! | public      | anything, including no site               |
//! | `protected` | the owner or a subclass of it             |
//! | `private`   | the owner itself                          |
//!
//! Members whose flags are unknown are never accessible.

#ifndef MEMSCOPE_TYPES_SYMBOL_TABLE_HPP
#define MEMSCOPE_TYPES_SYMBOL_TABLE_HPP

#include "common.hpp"
#include "types/context.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace memscope::types {

/// Description of a member to declare.
struct MemberDef {
    std::string name;                                 ///< Member name.
    SymbolKind kind = SymbolKind::Term;               ///< What the member declares.
    std::optional<SymbolFlags> flags = SymbolFlags{}; ///< Modifiers; nullopt = not known yet.
    std::vector<TypePtr> signatures;                  ///< Overload alternatives.
};

/// In-memory `MemberContext`.
///
/// # Usage
///
/// ```cpp
/// SymbolTable table;
/// table.define_class("Animal");
/// table.define_class("Dog", {"Animal"});
/// table.define_member("Animal", {.name = "speak", .signatures = {make_func({}, str)}});
/// auto dog = table.class_type("Dog");
/// ```
class SymbolTable : public MemberContext {
public:
    SymbolTable() = default;
    SymbolTable(const SymbolTable&) = delete;
    SymbolTable& operator=(const SymbolTable&) = delete;

    // ========================================================================
    // Definitions
    // ========================================================================

    /// Registers a top-level class. Every parent must already be defined.
    auto define_class(const std::string& name, const std::vector<std::string>& parents = {},
                      bool is_module = false) -> Result<const ClassSymbol*, std::string>;

    /// Declares a member of `owner`.
    auto define_member(const std::string& owner, MemberDef def)
        -> Result<const Symbol*, std::string>;

    /// Registers a class and declares it as a `Class` member of `owner`.
    /// Module classes get the `Module` flag on their member symbol.
    auto define_nested_class(const std::string& owner, const std::string& name,
                             const std::vector<std::string>& parents = {}, bool is_module = false,
                             SymbolFlags flags = {}) -> Result<const Symbol*, std::string>;

    /// Marks a member as dropped; denotations of it stop existing.
    /// Returns false if the symbol is not owned by this table.
    bool invalidate(const Symbol* sym);

    // ========================================================================
    // Lookups
    // ========================================================================

    [[nodiscard]] auto lookup_class(const std::string& name) const -> const ClassSymbol*;

    /// Class type for `name`, or nullptr if no such class exists.
    [[nodiscard]] auto class_type(const std::string& name) const -> TypePtr;

    /// First member named `name` declared directly in `owner`.
    [[nodiscard]] auto lookup_member(const std::string& owner, const std::string& name) const
        -> const Symbol*;

    [[nodiscard]] auto class_count() const -> size_t {
        return classes_.size();
    }

    // ========================================================================
    // MemberContext
    // ========================================================================

    [[nodiscard]] auto widen(const TypePtr& type) const -> TypePtr override;
    [[nodiscard]] auto base_classes(const TypePtr& type) const
        -> std::vector<const ClassSymbol*> override;
    [[nodiscard]] auto declarations(const ClassSymbol& cls) const
        -> std::span<const Symbol* const> override;
    [[nodiscard]] auto alternatives(const Symbol& sym, const ClassSymbol& via) const
        -> std::vector<Denotation> override;
    [[nodiscard]] auto is_accessible_from(const Symbol& sym, const TypePtr& site) const
        -> bool override;

private:
    auto register_class(const std::string& name, const std::vector<std::string>& parents,
                        bool is_module) -> Result<ClassSymbol*, std::string>;
    auto linearize(const ClassSymbol& cls) const -> std::vector<const ClassSymbol*>;
    auto find_class_mut(const std::string& name) -> ClassSymbol*;

    std::unordered_map<std::string, Box<ClassSymbol>> classes_; ///< Classes by name.
    std::vector<Box<Symbol>> symbols_;                          ///< Every declared member.
};

} // namespace memscope::types

#endif // MEMSCOPE_TYPES_SYMBOL_TABLE_HPP
