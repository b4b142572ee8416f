#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "sprig/beans/bean_registry.hpp"

namespace sprig::aot {

/**
 * @brief Replays generated bean registrations into a registry
 *
 * Generated classes derive from this and are instantiated through an
 * InitializerCatalog at startup.
 */
class RegistrationInitializer {
public:
    virtual ~RegistrationInitializer() = default;

    virtual std::string name() const = 0;
    virtual void initialize(beans::BeanRegistry& registry) = 0;
};

/**
 * @brief Maps generated class identifiers to factories for them
 *
 * Filled explicitly by the generated register_initializers() function; no
 * static self-registration is involved.
 */
class InitializerCatalog {
public:
    using Factory = std::function<std::unique_ptr<RegistrationInitializer>()>;

    void add(const std::string& identifier, Factory factory);

    template <typename T>
    void add(const std::string& identifier) {
        add(identifier, []() -> std::unique_ptr<RegistrationInitializer> {
            return std::make_unique<T>();
        });
    }

    bool contains(const std::string& identifier) const;
    // Throws AotProcessingError for an unknown identifier
    std::unique_ptr<RegistrationInitializer> create(
        const std::string& identifier) const;
    std::vector<std::string> identifiers() const;
    std::size_t size() const { return factories_.size(); }

private:
    std::map<std::string, Factory> factories_;
};

}  // namespace sprig::aot
