//! # Member Context
//!
//! The questions the member collector asks the type system. A context is one
//! analysis snapshot: the collector only reads through it, and callers pass it
//! explicitly to every query.
//!
//! Implementations must keep the answers stable for the duration of a call;
//! the collector adds no synchronization of its own. Exceptions thrown by an
//! implementation propagate to the caller of the collector unchanged.

#ifndef MEMSCOPE_TYPES_CONTEXT_HPP
#define MEMSCOPE_TYPES_CONTEXT_HPP

#include "types/symbol.hpp"
#include "types/type.hpp"

#include <span>
#include <vector>

namespace memscope::types {

/// Read-only view of the type system used by member collection.
class MemberContext {
public:
    virtual ~MemberContext() = default;

    /// Nominal upper bound of `type` (singleton and refined types widen).
    [[nodiscard]] virtual auto widen(const TypePtr& type) const -> TypePtr = 0;

    /// Linearized ancestors of `type`, most derived first, without duplicates.
    /// Empty when the type has no class.
    [[nodiscard]] virtual auto base_classes(const TypePtr& type) const
        -> std::vector<const ClassSymbol*> = 0;

    /// Members declared directly in `cls`, in declaration order.
    [[nodiscard]] virtual auto declarations(const ClassSymbol& cls) const
        -> std::span<const Symbol* const> = 0;

    /// Every overload alternative of `sym`, seen through base class `via`.
    [[nodiscard]] virtual auto alternatives(const Symbol& sym, const ClassSymbol& via) const
        -> std::vector<Denotation> = 0;

    /// Whether `sym` may be referenced from code whose `this` type is `site`.
    [[nodiscard]] virtual auto is_accessible_from(const Symbol& sym, const TypePtr& site) const
        -> bool = 0;
};

} // namespace memscope::types

#endif // MEMSCOPE_TYPES_CONTEXT_HPP
