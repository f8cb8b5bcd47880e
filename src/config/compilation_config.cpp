#include "kiln/config/compilation_config.hpp"

#include <stdexcept>

namespace kiln::config {

void CompilationConfig::from_ptree(const boost::property_tree::ptree& pt) {
    enabled = get_value(pt, "enabled", enabled);
    directory = get_value(pt, "directory", directory);
    container_name = get_value(pt, "container_name", container_name);
    parent_type = get_value(pt, "parent_type", parent_type);
    autowiring = get_value(pt, "autowiring", autowiring);
    load_vector(pt, "known_classes", known_classes);
}

void CompilationConfig::validate() const {
    if (!enabled) {
        return;
    }

    if (directory.empty()) {
        throw std::invalid_argument(
            "Compilation directory cannot be empty when compilation is "
            "enabled");
    }

    if (container_name.empty()) {
        throw std::invalid_argument(
            "Compiled container name cannot be empty when compilation is "
            "enabled");
    }

    if (parent_type.empty()) {
        throw std::invalid_argument("Compiled container parent_type cannot be "
                                    "empty");
    }
}

}  // namespace kiln::config
