#pragma once

#include <memory>
#include <stdexcept>
#include <string>
#include <type_traits>

#include "sprig/beans/bean_definition.hpp"
#include "sprig/beans/property_value.hpp"

namespace sprig::beans {

/**
 * @brief A property or factory argument after the container resolved it
 *
 * Literals are read with as<T>(), objects with bean<T>(). Both throw
 * std::invalid_argument on a type mismatch; the container reports that as a
 * BeanCreationError for the bean being built.
 */
class ResolvedValue {
public:
    explicit ResolvedValue(Literal literal);
    ResolvedValue(std::shared_ptr<void> instance,
                  std::shared_ptr<const BeanDefinition> definition);

    bool is_literal() const { return definition_ == nullptr; }
    const Literal& literal() const;
    const std::shared_ptr<const BeanDefinition>& definition() const {
        return definition_;
    }

    template <typename T>
    T as() const {
        const Literal& value = literal();
        if constexpr (std::is_same_v<T, bool>) {
            if (auto v = std::get_if<bool>(&value)) return *v;
        } else if constexpr (std::is_integral_v<T>) {
            if (auto v = std::get_if<std::int64_t>(&value))
                return static_cast<T>(*v);
        } else if constexpr (std::is_floating_point_v<T>) {
            if (auto v = std::get_if<double>(&value)) return static_cast<T>(*v);
            if (auto v = std::get_if<std::int64_t>(&value))
                return static_cast<T>(*v);
        } else {
            static_assert(std::is_constructible_v<T, const std::string&>,
                          "Literal values convert to bool, arithmetic or "
                          "string-constructible types only");
            if (auto v = std::get_if<std::string>(&value)) return T(*v);
        }
        throw std::invalid_argument("Cannot convert " +
                                    literal_type_name(value) + " literal '" +
                                    literal_to_string(value) + "' to " +
                                    TypeDescriptor::of<T>().name());
    }

    template <typename T>
    std::shared_ptr<T> bean() const {
        if (is_literal()) {
            throw std::invalid_argument(
                "Expected a bean of type " + TypeDescriptor::of<T>().name() +
                " but got literal '" + literal_to_string(literal_) + "'");
        }
        auto target = std::type_index(typeid(T));
        if (!definition_->is_assignable_to(target)) {
            throw std::invalid_argument(
                "Bean of type " + definition_->type().name() +
                " is not assignable to " + TypeDescriptor::of<T>().name());
        }
        return std::static_pointer_cast<T>(
            definition_->up_cast(target, instance_));
    }

    std::string to_string() const;

private:
    Literal literal_;
    std::shared_ptr<void> instance_;
    std::shared_ptr<const BeanDefinition> definition_;
};

}  // namespace sprig::beans
