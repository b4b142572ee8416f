#include "sprig/beans/container_config.hpp"

#include <stdexcept>

namespace sprig::beans {

void ContainerConfig::from_ptree(const boost::property_tree::ptree& pt) {
    if (auto policy =
            get_optional_value<std::string>(pt, "registration_policy")) {
        registration_policy = policy_from_string(*policy);
    }
    prefer_primary = get_value(pt, "prefer_primary", prefer_primary);
}

ContainerOptions ContainerConfig::to_options() const {
    ContainerOptions options;
    options.registration_policy = registration_policy;
    options.prefer_primary = prefer_primary;
    return options;
}

RegistrationPolicy ContainerConfig::policy_from_string(
    const std::string& value) {
    if (value == "permissive") return RegistrationPolicy::PERMISSIVE;
    if (value == "strict") return RegistrationPolicy::STRICT;
    throw std::invalid_argument("Invalid registration policy: " + value +
                                " (expected 'permissive' or 'strict')");
}

std::string ContainerConfig::policy_to_string(RegistrationPolicy policy) {
    return policy == RegistrationPolicy::STRICT ? "strict" : "permissive";
}

}  // namespace sprig::beans
