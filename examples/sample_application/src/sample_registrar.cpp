#include "sample/sample_registrar.hpp"

#include <iostream>

#include "sample/greeting.hpp"
#include "sprig/beans/bean_definition_registrar.hpp"

namespace sample {

using sprig::beans::ArgumentSpec;
using sprig::beans::BeanDefinitionRegistrar;

namespace {
const char* const HEADER = "sample/greeting.hpp";
}

void GreetingRegistrar::apply(sprig::beans::BeanRegistry& registry) {
    BeanDefinitionRegistrar<MessageSource>::of("messageSource")
        .property("greeting", "Hello")
        .description("Greeting text")
        .declared_in(HEADER)
        .register_with(registry);

    BeanDefinitionRegistrar<ConsoleGreeter>::of("greeter")
        .exposes<Greeter>()
        .with_factory_method("sample::make_greeter", &make_greeter,
                             {ArgumentSpec::of_type<MessageSource>(),
                              ArgumentSpec::literal(std::string("!"))})
        .property("prefix", "> ")
        .property("counter", BeanDefinitionRegistrar<Counter>::inner()
                                 .property("start", 1)
                                 .declared_in(HEADER))
        .primary()
        .declared_in(HEADER)
        .register_with(registry);

    BeanDefinitionRegistrar<ConsoleGreeter>::of("shoutingGreeter")
        .exposes<Greeter>()
        .with_factory_method("sample::make_greeter", &make_greeter,
                             {ArgumentSpec::reference("messageSource"),
                              ArgumentSpec::literal(std::string("!!!"))})
        .qualifier("experimental")
        .lazy()
        .declared_in(HEADER)
        .register_with(registry);

    BeanDefinitionRegistrar<ExperimentalBeanFilter>::of("excluder")
        .exposes<sprig::beans::DefinitionExcludeFilter>()
        .declared_in(HEADER)
        .register_with(registry);
}

void RuntimeRegistrar::apply(sprig::beans::BeanRegistry& registry) {
    BeanDefinitionRegistrar<AuditLog>::of("internalAuditLog")
        .exposes<sprig::context::Lifecycle>()
        .with_instance_supplier(
            [] { return std::make_shared<AuditLog>(std::clog); })
        .register_with(registry);
}

std::vector<std::shared_ptr<sprig::beans::Registrar>> all_registrars() {
    return {std::make_shared<GreetingRegistrar>(),
            std::make_shared<RuntimeRegistrar>()};
}

std::vector<std::shared_ptr<sprig::beans::Registrar>> runtime_registrars() {
    return {std::make_shared<RuntimeRegistrar>()};
}

}  // namespace sample
