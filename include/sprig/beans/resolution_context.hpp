#pragma once

#include <string>
#include <unordered_set>
#include <vector>

namespace sprig::beans {

/**
 * @brief Names currently under construction on one thread of a container
 */
class ResolutionContext {
public:
    // Throws CyclicDependencyError when the name is already being resolved
    void push_resolution(const std::string& bean_name);
    void pop_resolution(const std::string& bean_name);

    bool is_resolving(const std::string& bean_name) const {
        return resolution_stack_.count(bean_name) > 0;
    }

    const std::vector<std::string>& resolution_chain() const {
        return resolution_order_;
    }

private:
    std::unordered_set<std::string> resolution_stack_;
    std::vector<std::string> resolution_order_;
};

/**
 * @brief RAII guard for dependency resolution tracking
 */
class ResolutionGuard {
public:
    ResolutionGuard(ResolutionContext& ctx, std::string bean_name)
        : context_(ctx), bean_name_(std::move(bean_name)) {
        context_.push_resolution(bean_name_);
    }

    ~ResolutionGuard() { context_.pop_resolution(bean_name_); }

    ResolutionGuard(const ResolutionGuard&) = delete;
    ResolutionGuard& operator=(const ResolutionGuard&) = delete;

private:
    ResolutionContext& context_;
    std::string bean_name_;
};

}  // namespace sprig::beans
