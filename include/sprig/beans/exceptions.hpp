#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace sprig::beans {

/**
 * @brief Root of every error raised by the bean container and its registrars
 */
class BeansException : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief A definition could not be finalized (missing name, no construction
 * strategy, a customizer failure, ...)
 */
class InvalidDefinitionError : public BeansException {
public:
    InvalidDefinitionError(const std::string& bean_name,
                           const std::string& reason);

    const std::string& bean_name() const { return bean_name_; }

private:
    std::string bean_name_;
};

// Raised by a strict container when a name is registered twice
class DuplicateDefinitionError : public BeansException {
public:
    explicit DuplicateDefinitionError(const std::string& bean_name);

    const std::string& bean_name() const { return bean_name_; }

private:
    std::string bean_name_;
};

class NoSuchBeanError : public BeansException {
public:
    explicit NoSuchBeanError(const std::string& description);

    const std::string& description() const { return description_; }

private:
    std::string description_;
};

/**
 * @brief A query that needed exactly one bean matched zero or several
 */
class NonUniqueBeanError : public BeansException {
public:
    NonUniqueBeanError(const std::string& description,
                       std::vector<std::string> candidates);

    const std::string& description() const { return description_; }
    const std::vector<std::string>& candidates() const { return candidates_; }
    std::size_t match_count() const { return candidates_.size(); }

private:
    std::string description_;
    std::vector<std::string> candidates_;
};

class BeanNotOfRequiredTypeError : public BeansException {
public:
    BeanNotOfRequiredTypeError(const std::string& bean_name,
                               const std::string& required_type,
                               const std::string& actual_type);

    const std::string& bean_name() const { return bean_name_; }

private:
    std::string bean_name_;
};

/**
 * @brief Resolution re-entered a bean that is still under construction
 *
 * The chain lists the names from the first bean requested down to the one
 * that closed the loop, e.g. "a -> b -> a".
 */
class CyclicDependencyError : public BeansException {
public:
    explicit CyclicDependencyError(std::vector<std::string> chain);

    const std::vector<std::string>& chain() const { return chain_; }

private:
    std::vector<std::string> chain_;
};

// A factory, constructor or property setter threw while building a bean
class BeanCreationError : public BeansException {
public:
    BeanCreationError(const std::string& bean_name, const std::string& cause);

    const std::string& bean_name() const { return bean_name_; }

private:
    std::string bean_name_;
};

}  // namespace sprig::beans
