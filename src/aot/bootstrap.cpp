#include "sprig/aot/bootstrap.hpp"

#include <fstream>
#include <sstream>

#include "sprig/aot/exceptions.hpp"
#include "sprig/log/logger.hpp"

namespace sprig::aot {

const GeneratedFactories& FactoriesIndexCache::load(
    const std::filesystem::path& index_path) {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::string key = index_path.lexically_normal().string();
    auto it = entries_.find(key);
    if (it != entries_.end()) {
        return it->second;
    }

    std::ifstream in(index_path);
    if (!in) {
        throw AotProcessingError("Cannot read factories index " + key);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    auto parsed = GeneratedFactories::parse(buffer.str());
    SPRIG_LOG_DEBUG << "Loaded factories index " << key << " with "
                    << parsed.entries().size() << " keys";
    return entries_.emplace(key, std::move(parsed)).first->second;
}

void FactoriesIndexCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

std::size_t FactoriesIndexCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

std::size_t bootstrap(beans::BeanRegistry& registry,
                      const std::filesystem::path& index_path,
                      const InitializerCatalog& catalog,
                      FactoriesIndexCache& cache,
                      const std::optional<std::string>& key) {
    const GeneratedFactories& factories = cache.load(index_path);
    std::vector<std::string> identifiers =
        key ? factories.initializers(*key) : factories.all_initializers();

    // Resolve everything first so an unknown identifier registers nothing
    std::vector<std::unique_ptr<RegistrationInitializer>> initializers;
    for (const auto& identifier : identifiers) {
        initializers.push_back(catalog.create(identifier));
    }

    for (const auto& initializer : initializers) {
        SPRIG_LOG_DEBUG << "Applying generated initializer "
                        << initializer->name();
        initializer->initialize(registry);
    }
    SPRIG_LOG_INFO << "Bootstrapped " << initializers.size()
                   << " generated initializers from " << index_path.string();
    return initializers.size();
}

}  // namespace sprig::aot
