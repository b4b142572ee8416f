#pragma once

#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>

#include "sprig/aot/generated_factories.hpp"
#include "sprig/aot/registration_initializer.hpp"
#include "sprig/beans/bean_registry.hpp"

namespace sprig::aot {

/**
 * @brief Parsed factories indexes keyed by file path
 *
 * Owned by whoever bootstraps; clear() drops everything.
 */
class FactoriesIndexCache {
public:
    // Reads and parses the file on first use; AotProcessingError if missing
    // or malformed
    const GeneratedFactories& load(const std::filesystem::path& index_path);
    void clear();
    std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, GeneratedFactories> entries_;
};

/**
 * @brief Applies generated initializers to a registry
 *
 * Every initializer listed for `key` (all keys when empty) is created from
 * the catalog and run, in index order. Returns how many were applied.
 */
std::size_t bootstrap(beans::BeanRegistry& registry,
                      const std::filesystem::path& index_path,
                      const InitializerCatalog& catalog,
                      FactoriesIndexCache& cache,
                      const std::optional<std::string>& key = std::nullopt);

}  // namespace sprig::aot
