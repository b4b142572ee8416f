#include "sprig/beans/exceptions.hpp"

#include <sstream>

namespace sprig::beans {

namespace {

std::string join(const std::vector<std::string>& parts,
                 const std::string& separator) {
    std::ostringstream out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out << separator;
        out << parts[i];
    }
    return out.str();
}

std::string describe_bean(const std::string& bean_name) {
    return bean_name.empty() ? std::string("inner bean")
                             : "bean '" + bean_name + "'";
}

}  // namespace

InvalidDefinitionError::InvalidDefinitionError(const std::string& bean_name,
                                               const std::string& reason)
    : BeansException("Invalid definition for " + describe_bean(bean_name) +
                     ": " + reason),
      bean_name_(bean_name) {}

DuplicateDefinitionError::DuplicateDefinitionError(const std::string& bean_name)
    : BeansException("A bean definition named '" + bean_name +
                     "' is already registered"),
      bean_name_(bean_name) {}

NoSuchBeanError::NoSuchBeanError(const std::string& description)
    : BeansException("No bean available for " + description),
      description_(description) {}

NonUniqueBeanError::NonUniqueBeanError(const std::string& description,
                                       std::vector<std::string> candidates)
    : BeansException("Expected a single bean for " + description +
                     " but found " + std::to_string(candidates.size()) +
                     (candidates.empty() ? "" : ": " + join(candidates, ", "))),
      description_(description),
      candidates_(std::move(candidates)) {}

BeanNotOfRequiredTypeError::BeanNotOfRequiredTypeError(
    const std::string& bean_name, const std::string& required_type,
    const std::string& actual_type)
    : BeansException("Bean '" + bean_name + "' is expected to be of type '" +
                     required_type + "' but is of type '" + actual_type + "'"),
      bean_name_(bean_name) {}

CyclicDependencyError::CyclicDependencyError(std::vector<std::string> chain)
    : BeansException("Cyclic dependency detected while creating beans: " +
                     join(chain, " -> ")),
      chain_(std::move(chain)) {}

BeanCreationError::BeanCreationError(const std::string& bean_name,
                                     const std::string& cause)
    : BeansException("Error creating " + describe_bean(bean_name) + ": " +
                     cause),
      bean_name_(bean_name) {}

}  // namespace sprig::beans
