#pragma once

#include <functional>
#include <memory>
#include <string>
#include <typeindex>
#include <utility>
#include <vector>

#include "sprig/beans/property_value.hpp"
#include "sprig/beans/type_descriptor.hpp"

namespace sprig::beans {

class ConstructionStrategy;
class ResolvedValue;

/**
 * @brief Recipe for producing one bean
 *
 * A definition is assembled by a BeanDefinitionRegistrar and is immutable
 * once registered: registries only hold std::shared_ptr<const BeanDefinition>.
 * The instance pointer handed to construction, property application and
 * up-casts always points at the declared type.
 */
class BeanDefinition {
public:
    using PropertyApplier =
        std::function<void(const std::shared_ptr<void>& instance,
                           const std::string& property_name,
                           const ResolvedValue& value)>;

    BeanDefinition(std::string name, TypeDescriptor type);

    const std::string& name() const { return name_; }
    bool is_inner() const { return name_.empty(); }
    const TypeDescriptor& type() const { return type_; }

    // Declared type is always assignable; additional bases via exposes<>()
    const std::vector<ExposedType>& exposed_types() const {
        return exposed_types_;
    }
    bool is_assignable_to(std::type_index type) const;
    std::shared_ptr<void> up_cast(std::type_index target,
                                  const std::shared_ptr<void>& instance) const;

    const std::shared_ptr<const ConstructionStrategy>& construction_strategy()
        const {
        return strategy_;
    }

    const std::vector<std::pair<std::string, PropertyValue>>& property_values()
        const {
        return property_values_;
    }
    bool accepts_properties() const { return bool(property_applier_); }
    void apply_property(const std::shared_ptr<void>& instance,
                        const std::string& property_name,
                        const ResolvedValue& value) const;

    const std::vector<std::string>& qualifiers() const { return qualifiers_; }
    bool has_qualifier(const std::string& qualifier) const;
    bool is_primary() const { return primary_; }
    bool is_lazy_init() const { return lazy_init_; }
    const std::string& description() const { return description_; }
    const std::string& declaring_header() const { return declaring_header_; }

    // Mutators, only reachable before registration
    void set_name(std::string name) { name_ = std::move(name); }
    void add_exposed_type(ExposedType exposed);
    void set_construction_strategy(
        std::shared_ptr<const ConstructionStrategy> strategy) {
        strategy_ = std::move(strategy);
    }
    // Replaces an existing value with the same name in place
    void set_property_value(const std::string& property_name,
                            PropertyValue value);
    bool remove_property_value(const std::string& property_name);
    void set_property_applier(PropertyApplier applier) {
        property_applier_ = std::move(applier);
    }
    void add_qualifier(const std::string& qualifier);
    void set_primary(bool primary) { primary_ = primary; }
    void set_lazy_init(bool lazy_init) { lazy_init_ = lazy_init; }
    void set_description(std::string description) {
        description_ = std::move(description);
    }
    void set_declaring_header(std::string header) {
        declaring_header_ = std::move(header);
    }

    std::string to_string() const;

private:
    std::string name_;
    TypeDescriptor type_;
    std::vector<ExposedType> exposed_types_;
    std::shared_ptr<const ConstructionStrategy> strategy_;
    std::vector<std::pair<std::string, PropertyValue>> property_values_;
    PropertyApplier property_applier_;
    std::vector<std::string> qualifiers_;
    bool primary_ = false;
    bool lazy_init_ = false;
    std::string description_;
    std::string declaring_header_;
};

}  // namespace sprig::beans
