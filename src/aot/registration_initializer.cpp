#include "sprig/aot/registration_initializer.hpp"

#include "sprig/aot/exceptions.hpp"

namespace sprig::aot {

void InitializerCatalog::add(const std::string& identifier, Factory factory) {
    if (identifier.empty() || !factory) {
        throw AotProcessingError(
            "Initializer catalog entries need an identifier and a factory");
    }
    factories_[identifier] = std::move(factory);
}

bool InitializerCatalog::contains(const std::string& identifier) const {
    return factories_.count(identifier) > 0;
}

std::unique_ptr<RegistrationInitializer> InitializerCatalog::create(
    const std::string& identifier) const {
    auto it = factories_.find(identifier);
    if (it == factories_.end()) {
        throw AotProcessingError("No initializer named '" + identifier +
                                 "' is linked into this program");
    }
    auto initializer = it->second();
    if (!initializer) {
        throw AotProcessingError("Factory for initializer '" + identifier +
                                 "' returned nothing");
    }
    return initializer;
}

std::vector<std::string> InitializerCatalog::identifiers() const {
    std::vector<std::string> result;
    result.reserve(factories_.size());
    for (const auto& [identifier, factory] : factories_) {
        result.push_back(identifier);
    }
    return result;
}

}  // namespace sprig::aot
