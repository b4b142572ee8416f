#include "sprig/beans/resolution_context.hpp"

#include "sprig/beans/exceptions.hpp"

namespace sprig::beans {

void ResolutionContext::push_resolution(const std::string& bean_name) {
    if (resolution_stack_.count(bean_name)) {
        std::vector<std::string> chain = resolution_order_;
        chain.push_back(bean_name);
        throw CyclicDependencyError(std::move(chain));
    }
    resolution_stack_.insert(bean_name);
    resolution_order_.push_back(bean_name);
}

void ResolutionContext::pop_resolution(const std::string& bean_name) {
    resolution_stack_.erase(bean_name);
    if (!resolution_order_.empty() && resolution_order_.back() == bean_name) {
        resolution_order_.pop_back();
    }
}

}  // namespace sprig::beans
