#pragma once

#include <string>

#include "sprig/beans/bean_registry.hpp"

namespace sprig::beans {

/**
 * @brief A unit of configuration that contributes bean definitions
 *
 * Applications list their registrars explicitly; nothing is discovered.
 */
class Registrar {
public:
    virtual ~Registrar() = default;

    virtual std::string name() const = 0;
    virtual void apply(BeanRegistry& registry) = 0;
};

}  // namespace sprig::beans
