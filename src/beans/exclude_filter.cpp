#include "sprig/beans/exclude_filter.hpp"

#include <algorithm>

namespace sprig::beans {

bool NamePatternExcludeFilter::is_excluded(
    const BeanDefinition& definition) const {
    const std::string& name = definition.name();
    if (std::find(names_.begin(), names_.end(), name) != names_.end()) {
        return true;
    }
    return std::any_of(fragments_.begin(), fragments_.end(),
                       [&name](const std::string& fragment) {
                           return !fragment.empty() &&
                                  name.find(fragment) != std::string::npos;
                       });
}

}  // namespace sprig::beans
