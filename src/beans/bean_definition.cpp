#include "sprig/beans/bean_definition.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>

#include "sprig/beans/construction_strategy.hpp"
#include "sprig/beans/resolved_value.hpp"

namespace sprig::beans {

BeanDefinition::BeanDefinition(std::string name, TypeDescriptor type)
    : name_(std::move(name)), type_(std::move(type)) {}

bool BeanDefinition::is_assignable_to(std::type_index type) const {
    if (type == type_.index()) return true;
    return std::any_of(exposed_types_.begin(), exposed_types_.end(),
                       [type](const ExposedType& exposed) {
                           return exposed.type.index() == type;
                       });
}

std::shared_ptr<void> BeanDefinition::up_cast(
    std::type_index target, const std::shared_ptr<void>& instance) const {
    if (target == type_.index()) return instance;
    for (const auto& exposed : exposed_types_) {
        if (exposed.type.index() == target) {
            return exposed.up_cast(instance);
        }
    }
    throw std::invalid_argument("Type " + type_.name() +
                                " does not expose the requested type");
}

void BeanDefinition::apply_property(const std::shared_ptr<void>& instance,
                                    const std::string& property_name,
                                    const ResolvedValue& value) const {
    if (!property_applier_) {
        throw std::logic_error("Type " + type_.name() +
                               " does not accept properties");
    }
    property_applier_(instance, property_name, value);
}

bool BeanDefinition::has_qualifier(const std::string& qualifier) const {
    return std::find(qualifiers_.begin(), qualifiers_.end(), qualifier) !=
           qualifiers_.end();
}

void BeanDefinition::add_exposed_type(ExposedType exposed) {
    if (is_assignable_to(exposed.type.index())) return;
    exposed_types_.push_back(std::move(exposed));
}

void BeanDefinition::set_property_value(const std::string& property_name,
                                        PropertyValue value) {
    for (auto& entry : property_values_) {
        if (entry.first == property_name) {
            entry.second = std::move(value);
            return;
        }
    }
    property_values_.emplace_back(property_name, std::move(value));
}

bool BeanDefinition::remove_property_value(const std::string& property_name) {
    auto it = std::find_if(
        property_values_.begin(), property_values_.end(),
        [&](const auto& entry) { return entry.first == property_name; });
    if (it == property_values_.end()) return false;
    property_values_.erase(it);
    return true;
}

void BeanDefinition::add_qualifier(const std::string& qualifier) {
    if (!has_qualifier(qualifier)) qualifiers_.push_back(qualifier);
}

std::string BeanDefinition::to_string() const {
    std::ostringstream out;
    out << (is_inner() ? std::string("(inner bean)") : "'" + name_ + "'")
        << " of type " << type_.name();
    if (strategy_) out << " via " << strategy_->description();
    if (primary_) out << " [primary]";
    if (lazy_init_) out << " [lazy]";
    return out.str();
}

}  // namespace sprig::beans
