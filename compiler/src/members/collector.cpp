//! # Member Collector Implementation
//!
//! Filtering and the two hierarchy walks. The walks differ only in what they
//! keep per included declaration: the declaration itself (deduplicated), or
//! all of its alternatives (in order, not deduplicated).

#include "members/collector.hpp"

#include "log/log.hpp"

#include <iterator>

namespace memscope::members {

using types::ClassSymbol;
using types::Denotation;
using types::MemberContext;
using types::Symbol;
using types::SymbolFlag;
using types::SymbolKind;
using types::TypePtr;

// ============================================================================
// SymbolSet
// ============================================================================

bool SymbolSet::insert(const Symbol* sym) {
    if (!index_.insert(sym).second)
        return false;
    order_.push_back(sym);
    return true;
}

auto SymbolSet::names() const -> std::vector<std::string> {
    std::vector<std::string> result;
    result.reserve(order_.size());
    for (const Symbol* sym : order_) {
        result.push_back(sym->name);
    }
    return result;
}

// ============================================================================
// Filtering
// ============================================================================

auto kind_matches(const Symbol& sym, bool want_type, bool is_applied) -> bool {
    switch (sym.kind) {
    case SymbolKind::Term:
        return !want_type;
    case SymbolKind::Type:
        return want_type;
    case SymbolKind::Class:
        if (want_type)
            return true;
        // Constructor proxy; module classes have no constructor to call
        return is_applied && sym.lacks(SymbolFlag::Module);
    }
    return false;
}

auto included(const Symbol& sym, const FilterPolicy& policy, const MemberContext& ctx) -> bool {
    if (!kind_matches(sym, policy.wants_type(), policy.is_applied))
        return false;

    // lacks() is false while flags are unknown, so only the checks a policy
    // actually enforces reject such a symbol
    if (!policy.include_constructors && !sym.lacks(SymbolFlag::Constructor))
        return false;
    if (!policy.include_synthetic && !sym.lacks(SymbolFlag::Synthetic))
        return false;
    if (!policy.include_private && !sym.lacks(SymbolFlag::Private))
        return false;

    if (!policy.has_site() || !policy.check_accessibility)
        return true;
    return ctx.is_accessible_from(sym, policy.site);
}

// ============================================================================
// Collection
// ============================================================================

namespace {

// Widened base classes of `type`; empty when there is nothing to walk.
auto bases_of(const TypePtr& type, const MemberContext& ctx) -> std::vector<const ClassSymbol*> {
    if (types::is_absent(type))
        return {};
    TypePtr widened = ctx.widen(type);
    if (types::is_absent(widened))
        return {};
    return ctx.base_classes(widened);
}

} // namespace

auto collect_symbols(const TypePtr& type, const FilterPolicy& policy, const MemberContext& ctx)
    -> SymbolSet {
    SymbolSet result;
    size_t seen = 0;

    auto bases = bases_of(type, ctx);
    for (const ClassSymbol* bc : bases) {
        if (!bc)
            continue;
        for (const Symbol* sym : ctx.declarations(*bc)) {
            if (!sym)
                continue;
            ++seen;
            if (included(*sym, policy, ctx))
                result.insert(sym);
        }
    }

    MEMSCOPE_LOG_TRACE("members", "collect_symbols " << types::type_to_string(type) << " ["
                                                     << to_string(policy) << "]: "
                                                     << bases.size() << " base classes, "
                                                     << result.size() << " of " << seen
                                                     << " declarations kept");
    return result;
}

auto collect_denotations(const TypePtr& type, const FilterPolicy& policy, const MemberContext& ctx)
    -> std::vector<Denotation> {
    std::vector<Denotation> result;
    size_t kept = 0;

    auto bases = bases_of(type, ctx);
    for (const ClassSymbol* bc : bases) {
        if (!bc)
            continue;
        for (const Symbol* sym : ctx.declarations(*bc)) {
            if (!sym || !included(*sym, policy, ctx))
                continue;
            ++kept;
            auto alts = ctx.alternatives(*sym, *bc);
            result.insert(result.end(), std::make_move_iterator(alts.begin()),
                          std::make_move_iterator(alts.end()));
        }
    }

    MEMSCOPE_LOG_TRACE("members", "collect_denotations " << types::type_to_string(type) << " ["
                                                         << to_string(policy) << "]: " << kept
                                                         << " declarations, " << result.size()
                                                         << " denotations");
    return result;
}

auto is_valid_member(const Denotation& denot, bool want_type, const TypePtr& site,
                     bool check_accessibility, const MemberContext& ctx) -> bool {
    if (!denot.exists())
        return false;

    const Symbol& sym = *denot.symbol;
    if (!sym.lacks(SymbolFlag::Constructor) || !sym.lacks(SymbolFlag::Synthetic) ||
        !sym.lacks(SymbolFlag::Private)) {
        return false;
    }
    if (check_accessibility && !types::is_absent(site) && !ctx.is_accessible_from(sym, site))
        return false;
    return kind_matches(sym, want_type, /*is_applied=*/false);
}

} // namespace memscope::members
