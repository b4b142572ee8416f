#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "sprig/beans/bean_definition.hpp"
#include "sprig/beans/type_descriptor.hpp"

namespace sprig::beans {

/**
 * @brief Immutable query over bean definitions
 *
 * A selector combines an optional type, an optional name, an optional
 * qualifier and any number of described filters, all of which must hold.
 * Refinements return a new selector. Two selectors are equal when their
 * components are; filters compare by description, in order.
 */
class BeanSelector {
public:
    using Predicate = std::function<bool(const BeanDefinition&)>;

    struct Filter {
        std::string description;
        Predicate predicate;
    };

    static BeanSelector all() { return BeanSelector(); }

    template <typename T>
    static BeanSelector by_type() {
        return by_type(TypeDescriptor::of<T>());
    }
    static BeanSelector by_type(TypeDescriptor type);
    static BeanSelector by_name(std::string name);

    template <typename T>
    BeanSelector with_type() const {
        return with_type(TypeDescriptor::of<T>());
    }
    BeanSelector with_type(TypeDescriptor type) const;
    BeanSelector with_name(std::string name) const;
    BeanSelector with_qualifier(std::string qualifier) const;
    /// `description` reads as a clause, e.g. "that are lazy"; it must not be
    /// empty.
    BeanSelector with_filter(std::string description,
                             Predicate predicate) const;

    const std::optional<TypeDescriptor>& type() const { return type_; }
    const std::optional<std::string>& name() const { return name_; }
    const std::optional<std::string>& qualifier() const { return qualifier_; }
    const std::vector<Filter>& filters() const { return filters_; }

    bool matches(const BeanDefinition& definition) const;

    // e.g. "beans of type 'app::Greeter' with qualifier 'console'"
    std::string description() const;

    bool operator==(const BeanSelector& other) const;
    bool operator!=(const BeanSelector& other) const {
        return !(*this == other);
    }

private:
    BeanSelector() = default;

    std::optional<TypeDescriptor> type_;
    std::optional<std::string> name_;
    std::optional<std::string> qualifier_;
    std::vector<Filter> filters_;
};

}  // namespace sprig::beans
