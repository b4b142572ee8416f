#pragma once

#include <functional>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "sprig/beans/bean_definition.hpp"
#include "sprig/beans/bean_registry.hpp"
#include "sprig/beans/construction_strategy.hpp"
#include "sprig/beans/resolved_value.hpp"

namespace sprig::beans {

using DefinitionCustomizer = std::function<void(BeanDefinition&)>;

/**
 * @brief Type-independent part of BeanDefinitionRegistrar
 *
 * Holds the definition under construction and performs the checks that run
 * when it is finalized.
 */
class BeanDefinitionRegistrarBase {
public:
    const std::string& bean_name() const { return definition_.name(); }
    bool is_registered() const { return registered_; }

protected:
    BeanDefinitionRegistrarBase(std::string name, TypeDescriptor type,
                                bool inner);

    // Applies customizers to a copy of the definition and validates it
    std::shared_ptr<const BeanDefinition> build() const;
    void do_register(BeanRegistry& registry);
    // True (and logged) once the definition has been registered
    bool frozen(const char* operation) const;

    BeanDefinition definition_;
    std::vector<DefinitionCustomizer> customizers_;
    bool inner_;
    bool registered_ = false;
};

/**
 * @brief Fluent builder for the definition of a bean of type T
 *
 * @code
 * BeanDefinitionRegistrar<ConsoleGreeter>::of("greeter")
 *     .exposes<Greeter>()
 *     .property("prefix", "> ")
 *     .register_with(registry);
 * @endcode
 *
 * A default constructible T gets a default constructor strategy; anything
 * else needs with_factory_method() or with_instance_supplier(). Property
 * values are delivered through `void T::set_property(const std::string&,
 * const ResolvedValue&)`.
 */
template <typename T>
class BeanDefinitionRegistrar : public BeanDefinitionRegistrarBase {
public:
    static BeanDefinitionRegistrar of(std::string name) {
        return BeanDefinitionRegistrar(std::move(name), false);
    }

    static BeanDefinitionRegistrar inner() {
        return BeanDefinitionRegistrar(std::string(), true);
    }

    template <typename Base>
    BeanDefinitionRegistrar& exposes() {
        if (!frozen("exposes")) {
            definition_.add_exposed_type(make_exposed_type<T, Base>());
        }
        return *this;
    }

    template <typename R, typename... Params>
    BeanDefinitionRegistrar& with_factory_method(
        std::string qualified_name, R (*factory)(Params...),
        std::vector<ArgumentSpec> arguments = {}) {
        if (!frozen("with_factory_method")) {
            definition_.set_construction_strategy(make_factory_method<T>(
                std::move(qualified_name), factory, std::move(arguments)));
        }
        return *this;
    }

    // Runtime-only construction; cannot be reproduced by generated code
    BeanDefinitionRegistrar& with_instance_supplier(
        std::function<std::shared_ptr<T>()> supplier) {
        if (!frozen("with_instance_supplier")) {
            FactoryMethod::Invoker invoker =
                [supplier = std::move(supplier)](
                    const std::vector<ResolvedValue>&) {
                    return detail::to_declared_instance<T>(supplier());
                };
            definition_.set_construction_strategy(
                std::make_shared<const FactoryMethod>(
                    std::string(), 0, std::vector<ArgumentSpec>{},
                    std::move(invoker)));
        }
        return *this;
    }

    BeanDefinitionRegistrar& property(const std::string& name,
                                      PropertyValue value) {
        if (!frozen("property")) {
            definition_.set_property_value(name, std::move(value));
        }
        return *this;
    }

    template <typename U>
    BeanDefinitionRegistrar& property(const std::string& name,
                                      const BeanDefinitionRegistrar<U>& inner) {
        return property(name, PropertyValue::inner(inner.to_definition()));
    }

    BeanDefinitionRegistrar& reference(const std::string& name,
                                       std::string bean_name) {
        return property(name, PropertyValue::reference(std::move(bean_name)));
    }

    BeanDefinitionRegistrar& qualifier(const std::string& qualifier) {
        if (!frozen("qualifier")) definition_.add_qualifier(qualifier);
        return *this;
    }

    BeanDefinitionRegistrar& primary(bool primary = true) {
        if (!frozen("primary")) definition_.set_primary(primary);
        return *this;
    }

    BeanDefinitionRegistrar& lazy(bool lazy_init = true) {
        if (!frozen("lazy")) definition_.set_lazy_init(lazy_init);
        return *this;
    }

    BeanDefinitionRegistrar& description(std::string description) {
        if (!frozen("description")) {
            definition_.set_description(std::move(description));
        }
        return *this;
    }

    // Header that generated code must include to spell T
    BeanDefinitionRegistrar& declared_in(std::string header) {
        if (!frozen("declared_in")) {
            definition_.set_declaring_header(std::move(header));
        }
        return *this;
    }

    BeanDefinitionRegistrar& customize(DefinitionCustomizer customizer) {
        if (!frozen("customize")) customizers_.push_back(std::move(customizer));
        return *this;
    }

    std::shared_ptr<const BeanDefinition> to_definition() const {
        return build();
    }

    void register_with(BeanRegistry& registry) { do_register(registry); }

private:
    BeanDefinitionRegistrar(std::string name, bool inner)
        : BeanDefinitionRegistrarBase(std::move(name), TypeDescriptor::of<T>(),
                                      inner) {
        if constexpr (std::is_default_constructible_v<T> &&
                      !std::is_abstract_v<T>) {
            definition_.set_construction_strategy(DefaultConstructor::of<T>());
        }
        if constexpr (requires(T& bean, const std::string& property_name,
                               const ResolvedValue& value) {
                          bean.set_property(property_name, value);
                      }) {
            definition_.set_property_applier(
                [](const std::shared_ptr<void>& instance,
                   const std::string& property_name,
                   const ResolvedValue& value) {
                    std::static_pointer_cast<T>(instance)->set_property(
                        property_name, value);
                });
        }
    }
};

}  // namespace sprig::beans
