#pragma once

#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

#include "kiln/compiler/artifact_cache.hpp"
#include "kiln/config/compilation_config.hpp"
#include "kiln/di/compiled_container.hpp"
#include "kiln/di/container.hpp"
#include "kiln/discovery/known_classes.hpp"

namespace kiln::di {

/**
 * @brief Assembles definitions and builds an interpreted or compiled
 * container
 *
 * ContainerBuilder builder(registry);
 * builder.add_definitions({{"db.host", "localhost"}})
 *     .enable_compilation("var/cache", "app::Container");
 * auto container = builder.build();
 *
 * Later definitions for the same identifier replace earlier ones.
 */
class ContainerBuilder {
public:
    using ParentFactory = std::function<std::unique_ptr<CompiledContainer>(
        CompiledContainer::Context)>;

    explicit ContainerBuilder(
        std::shared_ptr<const TypeIntrospector> types = nullptr);

    ContainerBuilder& add_definitions(const DefinitionMap& definitions);
    ContainerBuilder& add_definition(const std::string& id,
                                     Definition definition);
    ContainerBuilder& use_autowiring(bool enabled);

    /**
     * @brief Compile the definitions into `directory` under `container_name`
     *
     * The artifact is written by the first build and reused by every later
     * build with the same directory and name.
     */
    ContainerBuilder& enable_compilation(
        std::filesystem::path directory,
        std::string container_name = "CompiledContainer",
        std::string parent_type = CompiledContainer::TYPE_NAME);

    // Compiled container deriving from Parent
    template <typename Parent>
    ContainerBuilder& enable_compilation(std::filesystem::path directory,
                                         std::string container_name) {
        const std::string parent_type = type_name_of<Parent>();
        register_parent<Parent>(parent_type);
        return enable_compilation(std::move(directory),
                                  std::move(container_name), parent_type);
    }

    /**
     * @brief Make Parent available as the base of compiled containers
     * declaring `parent_type`
     */
    template <typename Parent>
    ContainerBuilder& register_parent(const std::string& parent_type) {
        static_assert(std::is_base_of_v<CompiledContainer, Parent>,
                      "compiled container parents derive from "
                      "CompiledContainer");
        parents_.insert_or_assign(
            parent_type, [](CompiledContainer::Context context) {
                return std::unique_ptr<CompiledContainer>(
                    std::make_unique<Parent>(std::move(context)));
            });
        return *this;
    }

    // Also compile autowired entries for these classes
    ContainerBuilder& compile_all_classes(discovery::KnownClasses known);

    ContainerBuilder& configure(const config::CompilationConfig& config);

    bool compilation_enabled() const { return compilation_.has_value(); }

    /**
     * @brief Build with a cache local to this call
     */
    std::unique_ptr<Container> build();

    /**
     * @brief Build, reusing artifacts already loaded by `cache`
     * @throws InvalidArtifactNameError, CompilationError, ArtifactError
     */
    std::unique_ptr<Container> build(compiler::ArtifactCache& cache);

private:
    std::shared_ptr<const TypeIntrospector> types_;
    DefinitionMap definitions_;
    bool autowiring_ = true;
    std::optional<compiler::ArtifactIdentity> compilation_;
    std::vector<discovery::KnownClasses> known_classes_;
    std::map<std::string, ParentFactory> parents_;
};

}  // namespace kiln::di
