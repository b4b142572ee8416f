#include "sprig/aot/aot_config.hpp"

#include <stdexcept>

namespace sprig::aot {

void AotConfig::from_ptree(const boost::property_tree::ptree& pt) {
    output_dir = get_value(pt, "output_dir", output_dir);
    factory_name = get_value(pt, "factory_name", factory_name);
    if (auto exclude_pt = pt.get_child_optional("exclude")) {
        if (exclude_pt->get_child_optional("names")) {
            load_vector(*exclude_pt, "names", exclude_names);
        }
        if (exclude_pt->get_child_optional("contains")) {
            load_vector(*exclude_pt, "contains", exclude_contains);
        }
    }
    if (pt.get_child_optional("includes")) {
        load_vector(pt, "includes", includes);
    }
}

void AotConfig::validate() const {
    if (output_dir.empty()) {
        throw std::invalid_argument("aot.output_dir cannot be empty");
    }
    if (factory_name.empty()) {
        throw std::invalid_argument("aot.factory_name cannot be empty");
    }
}

AotOptions AotConfig::to_options() const {
    AotOptions options;
    options.output_dir = output_dir;
    options.factory_name = factory_name;
    options.exclude_names = exclude_names;
    options.exclude_contains = exclude_contains;
    options.includes = includes;
    return options;
}

}  // namespace sprig::aot
