#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "sprig/beans/bean_definition.hpp"

namespace sprig::beans {

/**
 * @brief Write side of a bean container
 *
 * Registrars and generated initializers only ever see this interface.
 */
class BeanRegistry {
public:
    virtual ~BeanRegistry() = default;

    virtual void register_definition(
        std::shared_ptr<const BeanDefinition> definition) = 0;
    virtual bool remove_definition(const std::string& name) = 0;
    virtual bool contains_definition(const std::string& name) const = 0;
    // Throws NoSuchBeanError for an unknown name
    virtual std::shared_ptr<const BeanDefinition> get_definition(
        const std::string& name) const = 0;
    // Registration order
    virtual std::vector<std::string> definition_names() const = 0;
    virtual std::size_t definition_count() const = 0;
};

}  // namespace sprig::beans
