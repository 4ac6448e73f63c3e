//! # Member Collector
//!
//! Enumerates the members visible on a type. Shared by code completion,
//! which needs every signature, and "did you mean" suggestions, which only
//! need the distinct declarations to rank by name.
//!
//! ## Entry Points
//!
//! | Function              | Result                                         |
//! |-----------------------|------------------------------------------------|
//! | `collect_symbols`     | distinct declarations, first-seen order        |
//! | `collect_denotations` | every overload of every match, hierarchy order |
//! | `is_valid_member`     | re-checks one known denotation                 |
//!
//! Both collectors widen the queried type, walk the base classes the context
//! reports (most derived first) and keep each directly declared member that
//! passes `included()`. Neither walks inheritance edges itself.
//!
//! ## Filtering
//!
//! A member is included iff all of the following hold:
//!
//! 1. its kind matches (`kind_matches()`)
//! 2. it is not a constructor, unless constructors are included
//! 3. it is not synthetic, unless synthetic members are included
//! 4. it is not private, unless private members are included
//! 5. there is no site, accessibility is not checked, or it is accessible
//!
//! Members whose flags are unknown fail each of checks 2-4 that the policy
//! enforces, and never pass the accessibility oracle.
//!
//! ## Error Handling
//!
//! Every function here is total. Exceptions raised by the context propagate
//! unchanged.

#ifndef MEMSCOPE_MEMBERS_COLLECTOR_HPP
#define MEMSCOPE_MEMBERS_COLLECTOR_HPP

#include "members/filter_policy.hpp"
#include "types/context.hpp"
#include "types/symbol.hpp"

#include <string>
#include <unordered_set>
#include <vector>

namespace memscope::members {

/// Set of declarations keyed by identity, iterated in insertion order.
class SymbolSet {
public:
    using const_iterator = std::vector<const types::Symbol*>::const_iterator;

    /// Adds `sym` unless already present. Returns true if it was added.
    bool insert(const types::Symbol* sym);

    [[nodiscard]] auto contains(const types::Symbol* sym) const -> bool {
        return index_.contains(sym);
    }

    [[nodiscard]] auto size() const -> size_t {
        return order_.size();
    }

    [[nodiscard]] auto empty() const -> bool {
        return order_.empty();
    }

    [[nodiscard]] auto begin() const -> const_iterator {
        return order_.begin();
    }

    [[nodiscard]] auto end() const -> const_iterator {
        return order_.end();
    }

    /// Member names in iteration order (duplicates possible for
    /// same-named declarations in different classes).
    [[nodiscard]] auto names() const -> std::vector<std::string>;

private:
    std::vector<const types::Symbol*> order_;
    std::unordered_set<const types::Symbol*> index_;
};

/// Whether `sym` is the kind of member the lookup wants.
///
/// Type lookups accept type members and classes. Term lookups accept terms,
/// and, when the access is applied, classes that are not modules: `Foo(...)`
/// calls the constructor proxy of class `Foo` even though the proxy is not a
/// stored member.
[[nodiscard]] auto kind_matches(const types::Symbol& sym, bool want_type, bool is_applied) -> bool;

/// Whether `sym` passes every check of `policy`.
[[nodiscard]] auto included(const types::Symbol& sym, const FilterPolicy& policy,
                            const types::MemberContext& ctx) -> bool;

/// Distinct declarations on `type` that pass `policy`.
[[nodiscard]] auto collect_symbols(const types::TypePtr& type, const FilterPolicy& policy,
                                   const types::MemberContext& ctx) -> SymbolSet;

/// Every overload alternative of every declaration on `type` that passes
/// `policy`, most derived base class first and in declaration order within a
/// class. Denotations reached through different base classes are all kept.
[[nodiscard]] auto collect_denotations(const types::TypePtr& type, const FilterPolicy& policy,
                                       const types::MemberContext& ctx)
    -> std::vector<types::Denotation>;

/// Re-validates a denotation found earlier without walking the hierarchy.
///
/// Stricter than `included()`: the symbol must still exist, and constructors,
/// synthetic and private members are always rejected. The kind check treats
/// the access as not applied.
///
/// A null or `no_type()` site disables the accessibility check, as it does in
/// `included()`: a missing call site excludes nothing and is not an error.
[[nodiscard]] auto is_valid_member(const types::Denotation& denot, bool want_type,
                                   const types::TypePtr& site, bool check_accessibility,
                                   const types::MemberContext& ctx) -> bool;

} // namespace memscope::members

#endif // MEMSCOPE_MEMBERS_COLLECTOR_HPP
