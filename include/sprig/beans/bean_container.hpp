#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <typeindex>
#include <unordered_map>
#include <vector>

#include "sprig/beans/bean_definition.hpp"
#include "sprig/beans/bean_registry.hpp"
#include "sprig/beans/bean_repository.hpp"
#include "sprig/beans/construction_strategy.hpp"
#include "sprig/beans/exclude_filter.hpp"
#include "sprig/beans/resolution_context.hpp"
#include "sprig/beans/resolved_value.hpp"

namespace sprig::beans {

enum class RegistrationPolicy {
    PERMISSIVE,  // last registration of a name wins
    STRICT       // registering a name twice throws DuplicateDefinitionError
};

struct ContainerOptions {
    RegistrationPolicy registration_policy = RegistrationPolicy::PERMISSIVE;
    // Resolve type ambiguity in favour of a single primary definition
    bool prefer_primary = false;
};

/**
 * @brief Default bean container: definition registry plus singleton cache
 *
 * Singletons are created lazily on first request (or eagerly by refresh())
 * and cached only once fully constructed, so a failed resolution leaves no
 * trace. Creation is serialized by a per-container recursive mutex; reads of
 * the definition map take a shared lock. Lock order is always singletons
 * first, definitions second.
 */
class BeanContainer : public BeanRegistry, public BeanRepository {
public:
    BeanContainer();
    explicit BeanContainer(ContainerOptions options);
    ~BeanContainer() override;

    BeanContainer(const BeanContainer&) = delete;
    BeanContainer& operator=(const BeanContainer&) = delete;

    // BeanRegistry
    void register_definition(
        std::shared_ptr<const BeanDefinition> definition) override;
    bool remove_definition(const std::string& name) override;
    bool contains_definition(const std::string& name) const override;
    std::shared_ptr<const BeanDefinition> get_definition(
        const std::string& name) const override;
    std::vector<std::string> definition_names() const override;
    std::size_t definition_count() const override;

    // BeanRepository
    std::shared_ptr<void> get_bean(const std::string& name) const override;
    std::shared_ptr<void> get_bean(const std::string& name,
                                   std::type_index type) const override;
    bool contains_bean(const std::string& name) const override;
    std::vector<std::string> matching_names(
        const BeanSelector& selector) const override;
    std::string resolve_unique_name(
        const BeanSelector& selector) const override;

    // Exclusion from AOT processing
    void add_exclude_filter(std::shared_ptr<const DefinitionExcludeFilter> filter);
    bool is_excluded(const std::string& name) const;
    std::vector<std::string> aot_visible_definition_names() const;

    // Eagerly creates every non-lazy singleton in registration order
    void refresh();
    // Marks the container refreshed without instantiating anything
    void refresh_for_aot_processing();
    bool is_refreshed() const;

    // Releases cached singletons in reverse creation order
    void destroy_singletons();
    std::size_t singleton_count() const;
    bool contains_singleton(const std::string& name) const;

    const ContainerOptions& options() const { return options_; }

private:
    std::shared_ptr<void> do_get_bean(const std::string& name,
                                      ResolutionContext& context) const;
    std::shared_ptr<void> create_bean(const BeanDefinition& definition,
                                      const std::string& display_name,
                                      ResolutionContext& context) const;
    ResolvedValue resolve_property_value(const PropertyValue& value,
                                         const std::string& owner,
                                         ResolutionContext& context) const;
    ResolvedValue resolve_argument(const ArgumentSpec& argument,
                                   const std::string& owner,
                                   ResolutionContext& context) const;
    ResolvedValue resolve_named(const std::string& name,
                                ResolutionContext& context) const;
    std::vector<std::shared_ptr<const DefinitionExcludeFilter>>
    collect_exclude_filters() const;

    ContainerOptions options_;

    mutable std::shared_mutex definitions_mutex_;
    std::unordered_map<std::string, std::shared_ptr<const BeanDefinition>>
        definitions_;
    std::vector<std::string> definition_order_;
    std::vector<std::shared_ptr<const DefinitionExcludeFilter>>
        exclude_filters_;
    bool refreshed_ = false;

    mutable std::recursive_mutex singletons_mutex_;
    mutable std::unordered_map<std::string, std::shared_ptr<void>> singletons_;
    mutable std::vector<std::string> creation_order_;
};

}  // namespace sprig::beans
