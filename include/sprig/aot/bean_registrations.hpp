#pragma once

#include <memory>
#include <string>
#include <vector>

#include "sprig/aot/aot_contribution.hpp"
#include "sprig/aot/bean_factory_aot_processor.hpp"
#include "sprig/beans/bean_definition.hpp"

namespace sprig::aot {

/**
 * @brief Queues code generation for every definition visible to AOT
 *
 * Nothing is queued when all definitions are excluded.
 */
class BeanRegistrationsAotProcessor : public BeanFactoryAotProcessor {
public:
    static constexpr const char* NAME = "bean-registrations";

    std::string name() const override { return NAME; }
    void process(const std::string& factory_name,
                 const beans::BeanContainer& container,
                 ContributionQueue& queue) override;
};

/**
 * @brief Generates <Factory>_BeanRegistrations and indexes it
 */
class BeanRegistrationsContribution : public AotContribution {
public:
    static constexpr const char* FEATURE_NAME = "BeanRegistrations";

    BeanRegistrationsContribution(
        std::string factory_name,
        std::vector<std::shared_ptr<const beans::BeanDefinition>> definitions);

    void apply_to(GenerationContext& context) override;
    std::string description() const override;

private:
    std::string factory_name_;
    std::vector<std::shared_ptr<const beans::BeanDefinition>> definitions_;
};

/**
 * @brief Generates sprig_generated/initializer_catalog.cpp
 *
 * The catalog lists every initializer in the factories index. While other
 * contributions are still pending it moves itself to the back of the queue,
 * so it is always generated last.
 */
class InitializerCatalogContribution : public AotContribution {
public:
    static constexpr const char* SOURCE_PATH =
        "sprig_generated/initializer_catalog.cpp";
    static constexpr const char* ONCE_KEY = "initializer-catalog";

    void apply_to(GenerationContext& context) override;
    std::string description() const override {
        return "initializer catalog";
    }

    static std::string generate_source(const GeneratedFactories& factories);
};

}  // namespace sprig::aot
