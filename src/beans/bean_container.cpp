#include "sprig/beans/bean_container.hpp"

#include <algorithm>
#include <unordered_map>

#include "sprig/beans/exceptions.hpp"
#include "sprig/log/logger.hpp"

namespace sprig::beans {

namespace {

// Resolutions in flight on this thread, per container. Lookups made from
// bean code (suppliers, factories, setters) join the outer chain.
thread_local std::unordered_map<const BeanContainer*, ResolutionContext>
    active_resolutions;

class ActiveResolution {
public:
    explicit ActiveResolution(const BeanContainer* container)
        : container_(container) {
        auto [it, inserted] = active_resolutions.try_emplace(container);
        context_ = &it->second;
        owner_ = inserted;
    }

    ~ActiveResolution() {
        if (owner_) active_resolutions.erase(container_);
    }

    ActiveResolution(const ActiveResolution&) = delete;
    ActiveResolution& operator=(const ActiveResolution&) = delete;

    ResolutionContext& context() { return *context_; }

private:
    const BeanContainer* container_;
    ResolutionContext* context_ = nullptr;
    bool owner_ = false;
};

}  // namespace

BeanContainer::BeanContainer() : BeanContainer(ContainerOptions{}) {}

BeanContainer::BeanContainer(ContainerOptions options) : options_(options) {}

BeanContainer::~BeanContainer() { destroy_singletons(); }

void BeanContainer::register_definition(
    std::shared_ptr<const BeanDefinition> definition) {
    if (!definition) {
        throw InvalidDefinitionError("", "definition must not be null");
    }
    const std::string& name = definition->name();
    if (name.empty()) {
        throw InvalidDefinitionError(
            name, "only named definitions can be registered");
    }

    std::lock_guard<std::recursive_mutex> singletons_lock(singletons_mutex_);
    std::unique_lock<std::shared_mutex> lock(definitions_mutex_);
    auto it = definitions_.find(name);
    if (it != definitions_.end()) {
        if (options_.registration_policy == RegistrationPolicy::STRICT) {
            SPRIG_LOG_ERROR << "Rejecting duplicate bean definition '" << name
                            << "'";
            throw DuplicateDefinitionError(name);
        }
        SPRIG_LOG_DEBUG << "Overriding bean definition '" << name << "': "
                        << it->second->to_string() << " -> "
                        << definition->to_string();
        it->second = std::move(definition);
        if (singletons_.erase(name) > 0) {
            creation_order_.erase(std::remove(creation_order_.begin(),
                                              creation_order_.end(), name),
                                  creation_order_.end());
        }
        return;
    }

    SPRIG_LOG_TRACE << "Registering bean definition " << definition->to_string();
    definition_order_.push_back(name);
    definitions_.emplace(name, std::move(definition));
}

bool BeanContainer::remove_definition(const std::string& name) {
    std::lock_guard<std::recursive_mutex> singletons_lock(singletons_mutex_);
    std::unique_lock<std::shared_mutex> lock(definitions_mutex_);
    if (definitions_.erase(name) == 0) return false;
    definition_order_.erase(
        std::remove(definition_order_.begin(), definition_order_.end(), name),
        definition_order_.end());
    if (singletons_.erase(name) > 0) {
        creation_order_.erase(
            std::remove(creation_order_.begin(), creation_order_.end(), name),
            creation_order_.end());
    }
    SPRIG_LOG_DEBUG << "Removed bean definition '" << name << "'";
    return true;
}

bool BeanContainer::contains_definition(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(definitions_mutex_);
    return definitions_.count(name) > 0;
}

std::shared_ptr<const BeanDefinition> BeanContainer::get_definition(
    const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(definitions_mutex_);
    auto it = definitions_.find(name);
    if (it == definitions_.end()) {
        throw NoSuchBeanError("bean named '" + name + "'");
    }
    return it->second;
}

std::vector<std::string> BeanContainer::definition_names() const {
    std::shared_lock<std::shared_mutex> lock(definitions_mutex_);
    return definition_order_;
}

std::size_t BeanContainer::definition_count() const {
    std::shared_lock<std::shared_mutex> lock(definitions_mutex_);
    return definitions_.size();
}

std::shared_ptr<void> BeanContainer::get_bean(const std::string& name) const {
    ActiveResolution resolution(this);
    return do_get_bean(name, resolution.context());
}

std::shared_ptr<void> BeanContainer::get_bean(const std::string& name,
                                              std::type_index type) const {
    auto definition = get_definition(name);
    if (!definition->is_assignable_to(type)) {
        std::string required = type.name();
        for (const auto& exposed : definition->exposed_types()) {
            if (exposed.type.index() == type) required = exposed.type.name();
        }
        throw BeanNotOfRequiredTypeError(name, required,
                                         definition->type().name());
    }
    return definition->up_cast(type, get_bean(name));
}

bool BeanContainer::contains_bean(const std::string& name) const {
    return contains_definition(name);
}

std::vector<std::string> BeanContainer::matching_names(
    const BeanSelector& selector) const {
    std::shared_lock<std::shared_mutex> lock(definitions_mutex_);
    std::vector<std::string> names;
    for (const auto& name : definition_order_) {
        if (selector.matches(*definitions_.at(name))) {
            names.push_back(name);
        }
    }
    return names;
}

std::string BeanContainer::resolve_unique_name(
    const BeanSelector& selector) const {
    auto names = matching_names(selector);
    if (names.empty()) {
        throw NoSuchBeanError(selector.description());
    }
    if (names.size() == 1) {
        return names.front();
    }
    if (options_.prefer_primary) {
        std::vector<std::string> primaries;
        for (const auto& name : names) {
            if (get_definition(name)->is_primary()) primaries.push_back(name);
        }
        if (primaries.size() == 1) {
            SPRIG_LOG_TRACE << "Selected primary bean '" << primaries.front()
                            << "' among " << names.size() << " "
                            << selector.description();
            return primaries.front();
        }
    }
    throw NonUniqueBeanError(selector.description(), std::move(names));
}

std::shared_ptr<void> BeanContainer::do_get_bean(
    const std::string& name, ResolutionContext& context) const {
    std::lock_guard<std::recursive_mutex> lock(singletons_mutex_);
    auto cached = singletons_.find(name);
    if (cached != singletons_.end()) {
        return cached->second;
    }

    auto definition = get_definition(name);
    ResolutionGuard guard(context, name);
    auto instance = create_bean(*definition, name, context);

    singletons_.emplace(name, instance);
    creation_order_.push_back(name);
    SPRIG_LOG_DEBUG << "Created singleton " << definition->to_string();
    return instance;
}

std::shared_ptr<void> BeanContainer::create_bean(
    const BeanDefinition& definition, const std::string& display_name,
    ResolutionContext& context) const {
    const auto& strategy = definition.construction_strategy();
    if (!strategy) {
        throw BeanCreationError(display_name, "no construction strategy");
    }

    std::vector<ResolvedValue> arguments;
    arguments.reserve(strategy->arguments().size());
    for (const auto& argument : strategy->arguments()) {
        arguments.push_back(resolve_argument(argument, display_name, context));
    }

    std::shared_ptr<void> instance;
    try {
        instance = strategy->instantiate(arguments);
    } catch (const BeansException&) {
        throw;
    } catch (const std::exception& e) {
        SPRIG_LOG_ERROR << "Failed to instantiate bean '" << display_name
                        << "' via " << strategy->description() << ": "
                        << e.what();
        throw BeanCreationError(display_name, e.what());
    }

    for (const auto& [property_name, value] : definition.property_values()) {
        auto resolved = resolve_property_value(value, display_name, context);
        try {
            definition.apply_property(instance, property_name, resolved);
        } catch (const BeansException&) {
            throw;
        } catch (const std::exception& e) {
            SPRIG_LOG_ERROR << "Failed to set property '" << property_name
                            << "' on bean '" << display_name
                            << "': " << e.what();
            throw BeanCreationError(
                display_name,
                "property '" + property_name + "': " + e.what());
        }
    }
    return instance;
}

ResolvedValue BeanContainer::resolve_property_value(
    const PropertyValue& value, const std::string& owner,
    ResolutionContext& context) const {
    switch (value.kind()) {
        case PropertyValue::Kind::LITERAL:
            return ResolvedValue(value.as_literal());
        case PropertyValue::Kind::INNER_BEAN: {
            const auto& inner = value.inner_definition();
            // Inner beans are never cached; each owner gets its own instance
            auto instance =
                create_bean(*inner, owner + "(inner bean)", context);
            return ResolvedValue(std::move(instance), inner);
        }
        case PropertyValue::Kind::REFERENCE:
            return resolve_named(value.reference_name(), context);
    }
    throw BeanCreationError(owner, "unsupported property value");
}

ResolvedValue BeanContainer::resolve_argument(const ArgumentSpec& argument,
                                              const std::string& owner,
                                              ResolutionContext& context) const {
    switch (argument.kind()) {
        case ArgumentSpec::Kind::LITERAL:
            return ResolvedValue(argument.as_literal());
        case ArgumentSpec::Kind::REFERENCE:
            return resolve_named(argument.reference_name(), context);
        case ArgumentSpec::Kind::TYPE_REFERENCE:
            return resolve_named(
                resolve_unique_name(
                    BeanSelector::by_type(argument.reference_type())),
                context);
    }
    throw BeanCreationError(owner, "unsupported argument");
}

ResolvedValue BeanContainer::resolve_named(const std::string& name,
                                           ResolutionContext& context) const {
    auto instance = do_get_bean(name, context);
    return ResolvedValue(std::move(instance), get_definition(name));
}

void BeanContainer::add_exclude_filter(
    std::shared_ptr<const DefinitionExcludeFilter> filter) {
    std::unique_lock<std::shared_mutex> lock(definitions_mutex_);
    exclude_filters_.push_back(std::move(filter));
}

std::vector<std::shared_ptr<const DefinitionExcludeFilter>>
BeanContainer::collect_exclude_filters() const {
    std::vector<std::shared_ptr<const DefinitionExcludeFilter>> filters;
    {
        std::shared_lock<std::shared_mutex> lock(definitions_mutex_);
        filters = exclude_filters_;
    }
    for (const auto& filter : select<DefinitionExcludeFilter>()) {
        filters.push_back(filter);
    }
    return filters;
}

bool BeanContainer::is_excluded(const std::string& name) const {
    auto definition = get_definition(name);
    for (const auto& filter : collect_exclude_filters()) {
        if (filter->is_excluded(*definition)) return true;
    }
    return false;
}

std::vector<std::string> BeanContainer::aot_visible_definition_names() const {
    auto filters = collect_exclude_filters();
    std::vector<std::string> visible;
    for (const auto& name : definition_names()) {
        auto definition = get_definition(name);
        bool excluded = std::any_of(
            filters.begin(), filters.end(),
            [&](const auto& filter) { return filter->is_excluded(*definition); });
        if (excluded) {
            SPRIG_LOG_DEBUG << "Bean '" << name
                            << "' is excluded from AOT processing";
        } else {
            visible.push_back(name);
        }
    }
    return visible;
}

void BeanContainer::refresh() {
    SPRIG_LOG_DEBUG << "Refreshing container with " << definition_count()
                    << " bean definitions";
    for (const auto& name : definition_names()) {
        if (get_definition(name)->is_lazy_init()) continue;
        try {
            get_bean(name);
        } catch (const std::exception& e) {
            SPRIG_LOG_ERROR << "Eager creation of bean '" << name
                            << "' failed: " << e.what();
            throw;
        }
    }
    std::unique_lock<std::shared_mutex> lock(definitions_mutex_);
    refreshed_ = true;
}

void BeanContainer::refresh_for_aot_processing() {
    std::unique_lock<std::shared_mutex> lock(definitions_mutex_);
    refreshed_ = true;
    SPRIG_LOG_DEBUG << "Container prepared for AOT processing with "
                    << definitions_.size() << " bean definitions";
}

bool BeanContainer::is_refreshed() const {
    std::shared_lock<std::shared_mutex> lock(definitions_mutex_);
    return refreshed_;
}

void BeanContainer::destroy_singletons() {
    std::lock_guard<std::recursive_mutex> lock(singletons_mutex_);
    while (!creation_order_.empty()) {
        std::string name = std::move(creation_order_.back());
        creation_order_.pop_back();
        auto it = singletons_.find(name);
        if (it == singletons_.end()) continue;
        auto instance = std::move(it->second);
        singletons_.erase(it);
        instance.reset();
        SPRIG_LOG_TRACE << "Released singleton '" << name << "'";
    }
    singletons_.clear();
}

std::size_t BeanContainer::singleton_count() const {
    std::lock_guard<std::recursive_mutex> lock(singletons_mutex_);
    return singletons_.size();
}

bool BeanContainer::contains_singleton(const std::string& name) const {
    std::lock_guard<std::recursive_mutex> lock(singletons_mutex_);
    return singletons_.count(name) > 0;
}

}  // namespace sprig::beans
