#pragma once

#include <string>
#include <vector>

#include "kiln/config/config.hpp"

namespace kiln::config {

// Container compilation settings, read from the "compilation" section:
//
//   compilation:
//     enabled: true
//     directory: var/cache/kiln
//     container_name: AppContainer
//     parent_type: kiln::di::CompiledContainer
//     autowiring: true
//     known_classes: [app::Mailer, app::Transport]
class CompilationConfig
    : public ClonableConfigurationProperties<CompilationConfig> {
public:
    static constexpr const char* DEFAULT_PARENT_TYPE =
        "kiln::di::CompiledContainer";

    bool enabled = false;
    std::string directory;
    std::string container_name = "CompiledContainer";
    std::string parent_type = DEFAULT_PARENT_TYPE;
    bool autowiring = true;
    std::vector<std::string> known_classes;

    void from_ptree(const boost::property_tree::ptree& pt) override;
    void validate() const override;
    std::string properties_name() const override { return "compilation"; }
};

}  // namespace kiln::config
