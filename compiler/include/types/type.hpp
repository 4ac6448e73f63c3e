//! # Types
//!
//! The slice of the type representation the member collector needs: nominal
//! class types, the precise types that widen to them, method signatures and
//! the no-type sentinel.

#ifndef MEMSCOPE_TYPES_TYPE_HPP
#define MEMSCOPE_TYPES_TYPE_HPP

#include "common.hpp"

#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace memscope::types {

// Forward declarations
struct Type;
struct ClassSymbol;
using TypePtr = std::shared_ptr<Type>;

// Nominal reference to a class, trait or module class: Dog
struct ClassType {
    const ClassSymbol* cls;
};

// Type of one stable value: dog.type
struct SingletonType {
    std::string name;   // The value the type is a singleton of
    TypePtr underlying; // Declared type of that value
};

// Structural refinement of a parent type: Animal { def name: Str }
struct RefinedType {
    TypePtr parent;
    std::vector<std::string> refinements; // Names of refined members
};

// Method signature: (A, B) => R
struct FuncType {
    std::vector<TypePtr> params;
    TypePtr result;
};

// Absence of a type; there is exactly one instance, see no_type()
struct NoType {};

// Type variant
struct Type {
    std::variant<ClassType, SingletonType, RefinedType, FuncType, NoType> kind;

    template <typename T> [[nodiscard]] auto is() const -> bool {
        return std::holds_alternative<T>(kind);
    }

    template <typename T> [[nodiscard]] auto as() -> T& {
        return std::get<T>(kind);
    }

    template <typename T> [[nodiscard]] auto as() const -> const T& {
        return std::get<T>(kind);
    }
};

// Helper functions
[[nodiscard]] auto make_class_type(const ClassSymbol* cls) -> TypePtr;
[[nodiscard]] auto make_singleton(std::string name, TypePtr underlying) -> TypePtr;
[[nodiscard]] auto make_refined(TypePtr parent, std::vector<std::string> refinements) -> TypePtr;
[[nodiscard]] auto make_func(std::vector<TypePtr> params, TypePtr result) -> TypePtr;

// The shared no-type sentinel. Compare with `==`, never by structure.
[[nodiscard]] auto no_type() -> const TypePtr&;

// True for a null pointer or the no-type sentinel
[[nodiscard]] auto is_absent(const TypePtr& type) -> bool;

// Strips singleton and refinement layers down to the nominal type.
// Class, function and absent types are returned unchanged.
[[nodiscard]] auto widen(const TypePtr& type) -> TypePtr;

// The class a (widened) type refers to, or nullptr
[[nodiscard]] auto class_of(const TypePtr& type) -> const ClassSymbol*;

[[nodiscard]] auto type_to_string(const TypePtr& type) -> std::string;

} // namespace memscope::types

#endif // MEMSCOPE_TYPES_TYPE_HPP
