#pragma once

#include <string>

#include "sprig/beans/bean_container.hpp"
#include "sprig/config/config.hpp"

namespace sprig::beans {

// `container:` section of the configuration
class ContainerConfig : public config::ConfigurationProperties {
public:
    RegistrationPolicy registration_policy = RegistrationPolicy::PERMISSIVE;
    bool prefer_primary = false;

    void from_ptree(const boost::property_tree::ptree& pt) override;
    std::string properties_name() const override { return "container"; }

    ContainerOptions to_options() const;

    static RegistrationPolicy policy_from_string(const std::string& value);
    static std::string policy_to_string(RegistrationPolicy policy);
};

}  // namespace sprig::beans
