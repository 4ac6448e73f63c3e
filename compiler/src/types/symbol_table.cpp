//! # Symbol Table Implementation
//!
//! Class and member registration, linearization, and the `MemberContext`
//! queries answered from the registered declarations.

#include "types/symbol_table.hpp"

#include "log/log.hpp"

#include <algorithm>

namespace memscope::types {

// ============================================================================
// Definitions
// ============================================================================

auto SymbolTable::register_class(const std::string& name, const std::vector<std::string>& parents,
                                 bool is_module) -> Result<ClassSymbol*, std::string> {
    if (name.empty())
        return std::string("class name must not be empty");
    if (classes_.contains(name))
        return "class '" + name + "' is already defined";

    auto cls = make_box<ClassSymbol>();
    cls->name = name;
    cls->is_module = is_module;
    for (const auto& parent_name : parents) {
        const ClassSymbol* parent = lookup_class(parent_name);
        if (!parent) {
            return "class '" + name + "' extends undefined class '" + parent_name + "'";
        }
        if (std::find(cls->parents.begin(), cls->parents.end(), parent) != cls->parents.end()) {
            return "class '" + name + "' lists parent '" + parent_name + "' twice";
        }
        cls->parents.push_back(parent);
    }
    cls->base_classes = linearize(*cls);

    MEMSCOPE_LOG_DEBUG("types", "defined class " << name << " with "
                                                 << cls->base_classes.size() << " base classes");

    ClassSymbol* raw = cls.get();
    classes_.emplace(name, std::move(cls));
    return raw;
}

auto SymbolTable::define_class(const std::string& name, const std::vector<std::string>& parents,
                               bool is_module) -> Result<const ClassSymbol*, std::string> {
    auto result = register_class(name, parents, is_module);
    if (is_err(result)) {
        MEMSCOPE_LOG_WARN("types", unwrap_err(result));
        return unwrap_err(result);
    }
    return static_cast<const ClassSymbol*>(unwrap(result));
}

auto SymbolTable::define_member(const std::string& owner, MemberDef def)
    -> Result<const Symbol*, std::string> {
    ClassSymbol* cls = find_class_mut(owner);
    if (!cls) {
        std::string message =
            "member '" + def.name + "' declared in undefined class '" + owner + "'";
        MEMSCOPE_LOG_WARN("types", message);
        return message;
    }
    if (def.name.empty()) {
        std::string message = "member of '" + owner + "' must have a name";
        MEMSCOPE_LOG_WARN("types", message);
        return message;
    }

    auto sym = make_box<Symbol>();
    sym->name = std::move(def.name);
    sym->kind = def.kind;
    sym->flags = def.flags;
    sym->owner = cls;
    sym->signatures = std::move(def.signatures);

    const Symbol* raw = sym.get();
    cls->decls.push_back(raw);
    symbols_.push_back(std::move(sym));
    return raw;
}

auto SymbolTable::define_nested_class(const std::string& owner, const std::string& name,
                                      const std::vector<std::string>& parents, bool is_module,
                                      SymbolFlags flags) -> Result<const Symbol*, std::string> {
    ClassSymbol* outer = find_class_mut(owner);
    if (!outer)
        return "class '" + name + "' nested in undefined class '" + owner + "'";

    auto registered = register_class(name, parents, is_module);
    if (is_err(registered))
        return unwrap_err(registered);

    if (is_module)
        flags |= SymbolFlag::Module;

    auto sym = make_box<Symbol>();
    sym->name = name;
    sym->kind = SymbolKind::Class;
    sym->flags = flags;
    sym->owner = outer;
    sym->declared = unwrap(registered);

    const Symbol* raw = sym.get();
    outer->decls.push_back(raw);
    symbols_.push_back(std::move(sym));
    return raw;
}

bool SymbolTable::invalidate(const Symbol* sym) {
    for (auto& owned : symbols_) {
        if (owned.get() == sym) {
            owned->valid = false;
            MEMSCOPE_LOG_DEBUG("types", "invalidated " << owned->name);
            return true;
        }
    }
    return false;
}

// Parents are folded in declaration order: each one puts the classes the
// earlier parents do not already contribute in front of the accumulator.
auto SymbolTable::linearize(const ClassSymbol& cls) const -> std::vector<const ClassSymbol*> {
    std::vector<const ClassSymbol*> acc;
    for (const ClassSymbol* parent : cls.parents) {
        std::vector<const ClassSymbol*> merged;
        for (const ClassSymbol* base : parent->base_classes) {
            if (std::find(acc.begin(), acc.end(), base) == acc.end())
                merged.push_back(base);
        }
        merged.insert(merged.end(), acc.begin(), acc.end());
        acc = std::move(merged);
    }
    acc.insert(acc.begin(), &cls);
    return acc;
}

// ============================================================================
// Lookups
// ============================================================================

auto SymbolTable::lookup_class(const std::string& name) const -> const ClassSymbol* {
    auto it = classes_.find(name);
    if (it != classes_.end())
        return it->second.get();
    return nullptr;
}

auto SymbolTable::find_class_mut(const std::string& name) -> ClassSymbol* {
    auto it = classes_.find(name);
    if (it != classes_.end())
        return it->second.get();
    return nullptr;
}

auto SymbolTable::class_type(const std::string& name) const -> TypePtr {
    const ClassSymbol* cls = lookup_class(name);
    if (!cls)
        return nullptr;
    return make_class_type(cls);
}

auto SymbolTable::lookup_member(const std::string& owner, const std::string& name) const
    -> const Symbol* {
    const ClassSymbol* cls = lookup_class(owner);
    if (!cls)
        return nullptr;
    for (const Symbol* sym : cls->decls) {
        if (sym->name == name)
            return sym;
    }
    return nullptr;
}

// ============================================================================
// MemberContext
// ============================================================================

auto SymbolTable::widen(const TypePtr& type) const -> TypePtr {
    return types::widen(type);
}

auto SymbolTable::base_classes(const TypePtr& type) const -> std::vector<const ClassSymbol*> {
    const ClassSymbol* cls = class_of(types::widen(type));
    if (!cls)
        return {};
    return cls->base_classes;
}

auto SymbolTable::declarations(const ClassSymbol& cls) const -> std::span<const Symbol* const> {
    return cls.decls;
}

auto SymbolTable::alternatives(const Symbol& sym, const ClassSymbol& via) const
    -> std::vector<Denotation> {
    std::vector<Denotation> result;
    if (sym.signatures.empty()) {
        // Type members and classes without a recorded signature still show once
        result.push_back(Denotation{&sym, no_type(), &via, 0});
        return result;
    }
    result.reserve(sym.signatures.size());
    for (size_t i = 0; i < sym.signatures.size(); ++i) {
        result.push_back(Denotation{&sym, sym.signatures[i], &via, i});
    }
    return result;
}

auto SymbolTable::is_accessible_from(const Symbol& sym, const TypePtr& site) const -> bool {
    if (!sym.flags)
        return false;
    if (sym.lacks(SymbolFlag::Private) && sym.lacks(SymbolFlag::Protected))
        return true;

    const ClassSymbol* site_cls = class_of(types::widen(site));
    if (!site_cls)
        return false;

    if (sym.is(SymbolFlag::Private))
        return site_cls == sym.owner;

    const auto& bases = site_cls->base_classes;
    return std::find(bases.begin(), bases.end(), sym.owner) != bases.end();
}

} // namespace memscope::types
