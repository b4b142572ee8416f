#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <typeindex>
#include <vector>

#include "sprig/beans/bean_selector.hpp"
#include "sprig/beans/exceptions.hpp"

namespace sprig::beans {

template <typename T>
class BeanSelection;

/**
 * @brief Read side of a bean container
 *
 * The virtual surface works on std::shared_ptr<void>; the templates on top
 * give callers typed access. A BeanSelection keeps a reference to the
 * repository it came from and must not outlive it.
 */
class BeanRepository {
public:
    virtual ~BeanRepository() = default;

    // Instance pointing at the bean's declared type
    virtual std::shared_ptr<void> get_bean(const std::string& name) const = 0;
    // Instance up-cast to `type`; BeanNotOfRequiredTypeError if not exposed
    virtual std::shared_ptr<void> get_bean(const std::string& name,
                                           std::type_index type) const = 0;
    virtual bool contains_bean(const std::string& name) const = 0;
    // Matching definition names in registration order
    virtual std::vector<std::string> matching_names(
        const BeanSelector& selector) const = 0;
    // NoSuchBeanError on zero matches, NonUniqueBeanError on ambiguity
    virtual std::string resolve_unique_name(
        const BeanSelector& selector) const = 0;

    template <typename T>
    std::shared_ptr<T> get() const {
        return get<T>(BeanSelector::by_type<T>());
    }

    template <typename T>
    std::shared_ptr<T> get(const BeanSelector& selector) const {
        BeanSelector typed =
            selector.type() ? selector : selector.with_type<T>();
        return get<T>(resolve_unique_name(typed));
    }

    template <typename T>
    std::shared_ptr<T> get(const std::string& name) const {
        return std::static_pointer_cast<T>(
            get_bean(name, std::type_index(typeid(T))));
    }

    template <typename T>
    BeanSelection<T> select() const {
        return select<T>(BeanSelector::by_type<T>());
    }

    template <typename T = void>
    BeanSelection<T> select(const BeanSelector& selector) const {
        if constexpr (std::is_void_v<T>) {
            return BeanSelection<T>(*this, selector, matching_names(selector));
        } else {
            BeanSelector typed =
                selector.type() ? selector : selector.with_type<T>();
            return BeanSelection<T>(*this, typed, matching_names(typed));
        }
    }
};

/**
 * @brief The beans matching a selector, in registration order
 *
 * Names are captured when the selection is made; instances are resolved on
 * first iteration or on to_single()/to_vector().
 */
template <typename T>
class BeanSelection {
public:
    using value_type = std::shared_ptr<T>;
    using const_iterator = typename std::vector<value_type>::const_iterator;

    BeanSelection(const BeanRepository& repository, BeanSelector selector,
                  std::vector<std::string> names)
        : repository_(&repository),
          selector_(std::move(selector)),
          names_(std::move(names)) {}

    std::size_t count() const { return names_.size(); }
    bool empty() const { return names_.empty(); }
    const std::vector<std::string>& names() const { return names_; }
    const BeanSelector& selector() const { return selector_; }

    value_type to_single() const {
        if (names_.size() != 1) {
            throw NonUniqueBeanError(selector_.description(), names_);
        }
        return resolve(names_.front());
    }

    value_type to_optional() const {
        if (names_.empty()) return nullptr;
        return to_single();
    }

    const std::vector<value_type>& to_vector() const {
        if (!instances_) {
            std::vector<value_type> instances;
            instances.reserve(names_.size());
            for (const auto& name : names_) {
                instances.push_back(resolve(name));
            }
            instances_ = std::move(instances);
        }
        return *instances_;
    }

    const_iterator begin() const { return to_vector().begin(); }
    const_iterator end() const { return to_vector().end(); }

private:
    value_type resolve(const std::string& name) const {
        if constexpr (std::is_void_v<T>) {
            return repository_->get_bean(name);
        } else {
            return repository_->template get<T>(name);
        }
    }

    const BeanRepository* repository_;
    BeanSelector selector_;
    std::vector<std::string> names_;
    mutable std::optional<std::vector<value_type>> instances_;
};

}  // namespace sprig::beans
