#include "sprig/aot/aot_pipeline.hpp"

#include "sprig/aot/bean_registrations.hpp"
#include "sprig/aot/exceptions.hpp"
#include "sprig/beans/exclude_filter.hpp"
#include "sprig/context/application_context.hpp"
#include "sprig/log/logger.hpp"

namespace sprig::aot {

namespace {

// Runs one pipeline stage, reporting any failure as AotProcessingError
template <typename Stage>
auto run_stage(const char* name, Stage&& stage) {
    SPRIG_LOG_DEBUG << "AOT stage: " << name;
    try {
        return stage();
    } catch (const AotProcessingError& e) {
        SPRIG_LOG_ERROR << "AOT stage '" << name << "' failed: " << e.what();
        throw;
    } catch (const PersistenceError& e) {
        SPRIG_LOG_ERROR << "AOT stage '" << name << "' failed: " << e.what();
        throw;
    } catch (const std::exception& e) {
        SPRIG_LOG_ERROR << "AOT stage '" << name << "' failed: " << e.what();
        throw AotProcessingError(std::string("AOT stage '") + name +
                                 "' failed: " + e.what());
    }
}

}  // namespace

AotPipeline::AotPipeline(AotOptions options) : options_(std::move(options)) {
    if (options_.factory_name.empty()) {
        throw AotProcessingError("AOT factory name must not be empty");
    }
    processors_.push_back(std::make_shared<BeanRegistrationsAotProcessor>());
}

AotPipeline& AotPipeline::add_processor(
    std::shared_ptr<BeanFactoryAotProcessor> processor) {
    if (!processor) {
        throw AotProcessingError("Cannot add a null AOT processor");
    }
    processors_.push_back(std::move(processor));
    return *this;
}

AotResult AotPipeline::run(
    const std::vector<std::shared_ptr<beans::Registrar>>& registrars) {
    context::ApplicationContext source(options_.container);
    for (const auto& registrar : registrars) {
        source.add_registrar(registrar);
    }
    return run(source);
}

std::vector<std::shared_ptr<BeanFactoryAotProcessor>>
AotPipeline::collect_processors(const beans::BeanContainer& container) const {
    auto processors = processors_;
    for (const auto& bean : container.select<BeanFactoryAotProcessor>()) {
        processors.push_back(bean);
    }
    return processors;
}

AotResult AotPipeline::run(context::ApplicationContext& source) {
    SPRIG_LOG_INFO << "Starting AOT processing for factory '"
                   << options_.factory_name << "' into "
                   << options_.output_dir.string();

    run_stage("build source container", [&] {
        source.container().add_exclude_filter(
            std::make_shared<beans::NamePatternExcludeFilter>(
                options_.exclude_names, options_.exclude_contains));
        if (source.state() ==
            context::ApplicationContext::State::CREATED) {
            source.refresh_for_aot_processing();
        }
        SPRIG_LOG_DEBUG << "Source container holds "
                        << source.container().definition_count()
                        << " bean definitions";
    });
    const beans::BeanContainer& container = source.container();

    auto processors = run_stage("collect processors", [&] {
        auto collected = collect_processors(container);
        SPRIG_LOG_DEBUG << "Collected " << collected.size()
                        << " AOT processors";
        return collected;
    });

    ProcessorTracker tracker;
    ContributionQueue queue;
    run_stage("process bean factory", [&] {
        for (const auto& processor : processors) {
            if (tracker.should_skip(processor->name(), options_.factory_name)) {
                SPRIG_LOG_DEBUG << "Processor " << processor->name()
                                << " already handled factory '"
                                << options_.factory_name << "'";
                continue;
            }
            processor->process(options_.factory_name, container, queue);
            tracker.mark_processed(processor->name(), options_.factory_name);
        }
    });

    FileSystemGeneratedFiles files(options_.output_dir);
    AotResult result;
    ClassNameGenerator class_names;
    GenerationContext generation(files, result.factories, class_names, queue,
                                 options_.includes);
    run_stage("drain contributions", [&] {
        result.applied_contributions = queue.drain(generation);
        // The catalog is always generated so host builds can rely on it
        if (generation.mark_once(InitializerCatalogContribution::ONCE_KEY)) {
            InitializerCatalogContribution().apply_to(generation);
        }
        SPRIG_LOG_DEBUG << "Applied " << result.applied_contributions
                        << " contributions";
    });

    run_stage("persist", [&] {
        result.factories.write_to(files);
        tracker.save(files);
        result.generated_files = files.commit();
    });

    SPRIG_LOG_INFO << "AOT processing finished: "
                   << result.generated_files.size() << " files written";
    return result;
}

}  // namespace sprig::aot
