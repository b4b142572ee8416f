#include "sprig/beans/bean_definition_registrar.hpp"

#include "sprig/beans/exceptions.hpp"
#include "sprig/log/logger.hpp"

namespace sprig::beans {

BeanDefinitionRegistrarBase::BeanDefinitionRegistrarBase(std::string name,
                                                         TypeDescriptor type,
                                                         bool inner)
    : definition_(std::move(name), std::move(type)), inner_(inner) {}

bool BeanDefinitionRegistrarBase::frozen(const char* operation) const {
    if (registered_) {
        SPRIG_LOG_WARN << "Ignoring " << operation << "() on bean '"
                       << definition_.name() << "' after registration";
    }
    return registered_;
}

std::shared_ptr<const BeanDefinition> BeanDefinitionRegistrarBase::build()
    const {
    const std::string& name = definition_.name();
    if (!inner_ && name.empty()) {
        throw InvalidDefinitionError(name, "bean name not set for type " +
                                               definition_.type().name());
    }

    auto definition = std::make_shared<BeanDefinition>(definition_);
    for (const auto& customizer : customizers_) {
        try {
            customizer(*definition);
        } catch (const BeansException&) {
            throw;
        } catch (const std::exception& e) {
            throw InvalidDefinitionError(
                name, std::string("customizer failed: ") + e.what());
        }
    }
    if (inner_) {
        definition->set_name(std::string());
    } else if (definition->name() != name) {
        throw InvalidDefinitionError(name,
                                     "customizers may not rename a bean");
    }

    const auto& strategy = definition->construction_strategy();
    if (!strategy) {
        throw InvalidDefinitionError(
            name, "no construction strategy for type " +
                      definition->type().name() +
                      ": it is not default constructible and no factory "
                      "method was given");
    }
    if (auto factory = std::dynamic_pointer_cast<const FactoryMethod>(strategy);
        factory && factory->arity() != factory->arguments().size()) {
        throw InvalidDefinitionError(
            name, factory->description() + " takes " +
                      std::to_string(factory->arity()) + " parameters but " +
                      std::to_string(factory->arguments().size()) +
                      " arguments were specified");
    }
    if (!definition->property_values().empty() &&
        !definition->accepts_properties()) {
        throw InvalidDefinitionError(
            name, "type " + definition->type().name() +
                      " has property values but no set_property member");
    }
    return definition;
}

void BeanDefinitionRegistrarBase::do_register(BeanRegistry& registry) {
    if (inner_) {
        throw InvalidDefinitionError(
            "", "inner bean definitions cannot be registered by themselves");
    }
    if (registered_) {
        throw InvalidDefinitionError(definition_.name(),
                                     "definition was already registered");
    }
    registry.register_definition(build());
    registered_ = true;
}

}  // namespace sprig::beans
