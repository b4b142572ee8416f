#pragma once

#include <string>
#include <vector>

#include "sprig/aot/aot_pipeline.hpp"
#include "sprig/config/config.hpp"

namespace sprig::aot {

// `aot:` section of the configuration
class AotConfig : public config::ConfigurationProperties {
public:
    std::string output_dir = "generated";
    std::string factory_name = "default";
    std::vector<std::string> exclude_names{"excluder"};
    std::vector<std::string> exclude_contains{"internal"};
    std::vector<std::string> includes;

    void from_ptree(const boost::property_tree::ptree& pt) override;
    void validate() const override;
    std::string properties_name() const override { return "aot"; }

    AotOptions to_options() const;
};

}  // namespace sprig::aot
