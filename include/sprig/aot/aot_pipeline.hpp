#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "sprig/aot/bean_factory_aot_processor.hpp"
#include "sprig/aot/generated_factories.hpp"
#include "sprig/beans/bean_container.hpp"
#include "sprig/beans/registrar.hpp"

namespace sprig::context {
class ApplicationContext;
}

namespace sprig::aot {

struct AotOptions {
    std::filesystem::path output_dir = "generated";
    std::string factory_name = "default";
    // Definitions hidden from processing by exact name or name fragment
    std::vector<std::string> exclude_names{"excluder"};
    std::vector<std::string> exclude_contains{"internal"};
    // Headers added to every generated registrations source
    std::vector<std::string> includes;
    beans::ContainerOptions container;
};

struct AotResult {
    std::vector<std::filesystem::path> generated_files;
    GeneratedFactories factories;
    std::size_t applied_contributions = 0;
};

/**
 * @brief Ahead-of-time processing from registrars to generated sources
 *
 * run() builds a source container from the registrars without creating any
 * bean, lets every processor (the built-in bean registrations processor,
 * processors added here and beans exposing BeanFactoryAotProcessor) queue
 * contributions for the configured factory name, drains the queue and only
 * then commits all output at once. Any failure before the commit leaves the
 * output directory untouched.
 */
class AotPipeline {
public:
    explicit AotPipeline(AotOptions options);

    AotPipeline& add_processor(std::shared_ptr<BeanFactoryAotProcessor> processor);

    AotResult run(const std::vector<std::shared_ptr<beans::Registrar>>& registrars);
    // Processes an already populated context
    AotResult run(context::ApplicationContext& source);

    const AotOptions& options() const { return options_; }

private:
    std::vector<std::shared_ptr<BeanFactoryAotProcessor>> collect_processors(
        const beans::BeanContainer& container) const;

    AotOptions options_;
    std::vector<std::shared_ptr<BeanFactoryAotProcessor>> processors_;
};

}  // namespace sprig::aot
