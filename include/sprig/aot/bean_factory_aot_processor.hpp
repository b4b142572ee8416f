#pragma once

#include <map>
#include <set>
#include <string>
#include <vector>

#include "sprig/aot/aot_contribution.hpp"
#include "sprig/beans/bean_container.hpp"

namespace sprig::aot {

/**
 * @brief Inspects a prepared container and queues generation work for it
 */
class BeanFactoryAotProcessor {
public:
    virtual ~BeanFactoryAotProcessor() = default;

    // Letters, digits and '-' only; used for the tracking manifest name
    virtual std::string name() const = 0;
    virtual void process(const std::string& factory_name,
                         const beans::BeanContainer& container,
                         ContributionQueue& queue) = 0;
};

/**
 * @brief Remembers which processor already handled which factory
 *
 * save() writes META-INF/sprig/processed/<processor>.processed with one
 * factory name per line.
 */
class ProcessorTracker {
public:
    static constexpr const char* DIRECTORY = "META-INF/sprig/processed/";

    bool should_skip(const std::string& processor,
                     const std::string& factory_name) const;
    void mark_processed(const std::string& processor,
                        const std::string& factory_name);

    std::vector<std::string> processed_factories(
        const std::string& processor) const;

    void save(GeneratedFiles& files) const;

private:
    // processor -> factory names in processing order
    std::map<std::string, std::vector<std::string>> processed_;
};

}  // namespace sprig::aot
