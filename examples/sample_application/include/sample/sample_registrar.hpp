#pragma once

#include <memory>
#include <string>
#include <vector>

#include "sprig/beans/registrar.hpp"

namespace sample {

// Greeting beans; everything here is generated ahead of time
class GreetingRegistrar : public sprig::beans::Registrar {
public:
    std::string name() const override { return "greetings"; }
    void apply(sprig::beans::BeanRegistry& registry) override;
};

// Beans that stay out of generated code and are registered at runtime
class RuntimeRegistrar : public sprig::beans::Registrar {
public:
    std::string name() const override { return "runtime"; }
    void apply(sprig::beans::BeanRegistry& registry) override;
};

std::vector<std::shared_ptr<sprig::beans::Registrar>> all_registrars();
std::vector<std::shared_ptr<sprig::beans::Registrar>> runtime_registrars();

}  // namespace sample
