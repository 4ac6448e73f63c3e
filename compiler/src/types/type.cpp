//! # Type Implementation
//!
//! Type construction, widening and display.
//!
//! ## Widening
//!
//! | Type             | Widens to                         |
//! |------------------|-----------------------------------|
//! | `x.type`         | widen(declared type of `x`)       |
//! | `P { ... }`      | widen(`P`)                        |
//! | class, function  | itself                            |
//! | absent           | itself                            |

#include "types/symbol.hpp"
#include "types/type.hpp"

#include <sstream>
#include <type_traits>

namespace memscope::types {

auto make_class_type(const ClassSymbol* cls) -> TypePtr {
    auto type = std::make_shared<Type>();
    type->kind = ClassType{cls};
    return type;
}

auto make_singleton(std::string name, TypePtr underlying) -> TypePtr {
    auto type = std::make_shared<Type>();
    type->kind = SingletonType{std::move(name), std::move(underlying)};
    return type;
}

auto make_refined(TypePtr parent, std::vector<std::string> refinements) -> TypePtr {
    auto type = std::make_shared<Type>();
    type->kind = RefinedType{std::move(parent), std::move(refinements)};
    return type;
}

auto make_func(std::vector<TypePtr> params, TypePtr result) -> TypePtr {
    auto type = std::make_shared<Type>();
    type->kind = FuncType{std::move(params), std::move(result)};
    return type;
}

auto no_type() -> const TypePtr& {
    static const TypePtr sentinel = std::make_shared<Type>(Type{NoType{}});
    return sentinel;
}

auto is_absent(const TypePtr& type) -> bool {
    return type == nullptr || type == no_type();
}

auto widen(const TypePtr& type) -> TypePtr {
    TypePtr current = type;
    while (current) {
        if (current->is<SingletonType>()) {
            current = current->as<SingletonType>().underlying;
        } else if (current->is<RefinedType>()) {
            current = current->as<RefinedType>().parent;
        } else {
            break;
        }
    }
    return current ? current : no_type();
}

auto class_of(const TypePtr& type) -> const ClassSymbol* {
    if (!type || !type->is<ClassType>())
        return nullptr;
    return type->as<ClassType>().cls;
}

auto type_to_string(const TypePtr& type) -> std::string {
    if (is_absent(type))
        return "<notype>";

    return std::visit(
        [](const auto& t) -> std::string {
            using T = std::decay_t<decltype(t)>;

            if constexpr (std::is_same_v<T, ClassType>) {
                return t.cls ? t.cls->name : "<unknown class>";
            } else if constexpr (std::is_same_v<T, SingletonType>) {
                return t.name + ".type";
            } else if constexpr (std::is_same_v<T, RefinedType>) {
                std::ostringstream oss;
                oss << type_to_string(t.parent) << " { ";
                for (size_t i = 0; i < t.refinements.size(); ++i) {
                    if (i > 0)
                        oss << "; ";
                    oss << t.refinements[i];
                }
                oss << " }";
                return oss.str();
            } else if constexpr (std::is_same_v<T, FuncType>) {
                std::ostringstream oss;
                oss << "(";
                for (size_t i = 0; i < t.params.size(); ++i) {
                    if (i > 0)
                        oss << ", ";
                    oss << type_to_string(t.params[i]);
                }
                oss << ") => " << type_to_string(t.result);
                return oss.str();
            } else {
                return "<notype>";
            }
        },
        type->kind);
}

} // namespace memscope::types
