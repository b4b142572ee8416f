#pragma once

#include <string>
#include <vector>

#include "sprig/beans/bean_definition.hpp"

namespace sprig::beans {

/**
 * @brief Hides definitions from ahead-of-time processing
 *
 * Excluded definitions stay fully resolvable at runtime; only AOT
 * processors skip them. A container consults the filters added to it
 * directly and every bean it holds that exposes this interface.
 */
class DefinitionExcludeFilter {
public:
    virtual ~DefinitionExcludeFilter() = default;

    virtual bool is_excluded(const BeanDefinition& definition) const = 0;
};

// Excludes exact names and names containing any of the given fragments
class NamePatternExcludeFilter : public DefinitionExcludeFilter {
public:
    NamePatternExcludeFilter() = default;
    NamePatternExcludeFilter(std::vector<std::string> names,
                             std::vector<std::string> fragments)
        : names_(std::move(names)), fragments_(std::move(fragments)) {}

    bool is_excluded(const BeanDefinition& definition) const override;

    const std::vector<std::string>& names() const { return names_; }
    const std::vector<std::string>& fragments() const { return fragments_; }

private:
    std::vector<std::string> names_;
    std::vector<std::string> fragments_;
};

}  // namespace sprig::beans
