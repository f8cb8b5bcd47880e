#include "kiln/di/container_builder.hpp"

#include <utility>

#include "kiln/compiler/container_compiler.hpp"
#include "kiln/log/logger.hpp"

namespace kiln::di {

ContainerBuilder::ContainerBuilder(
    std::shared_ptr<const TypeIntrospector> types)
    : types_(types ? std::move(types)
                   : std::make_shared<const TypeRegistry>()) {
    register_parent<CompiledContainer>(CompiledContainer::TYPE_NAME);
}

ContainerBuilder& ContainerBuilder::add_definitions(
    const DefinitionMap& definitions) {
    for (const auto& [id, definition] : definitions) {
        definitions_.insert_or_assign(id, definition);
    }
    return *this;
}

ContainerBuilder& ContainerBuilder::add_definition(const std::string& id,
                                                   Definition definition) {
    definitions_.insert_or_assign(id, std::move(definition));
    return *this;
}

ContainerBuilder& ContainerBuilder::use_autowiring(bool enabled) {
    autowiring_ = enabled;
    return *this;
}

ContainerBuilder& ContainerBuilder::enable_compilation(
    std::filesystem::path directory, std::string container_name,
    std::string parent_type) {
    compilation_ = compiler::ArtifactIdentity{
        std::move(directory), std::move(container_name),
        std::move(parent_type)};
    return *this;
}

ContainerBuilder& ContainerBuilder::compile_all_classes(
    discovery::KnownClasses known) {
    known_classes_.push_back(std::move(known));
    return *this;
}

ContainerBuilder& ContainerBuilder::configure(
    const config::CompilationConfig& config) {
    config.validate();
    use_autowiring(config.autowiring);
    if (config.enabled) {
        enable_compilation(config.directory, config.container_name,
                           config.parent_type);
    }
    if (!config.known_classes.empty()) {
        compile_all_classes(
            discovery::KnownClasses::from_list(config.known_classes));
    }
    return *this;
}

std::unique_ptr<Container> ContainerBuilder::build() {
    compiler::ArtifactCache cache;
    return build(cache);
}

std::unique_ptr<Container> ContainerBuilder::build(
    compiler::ArtifactCache& cache) {
    if (!compilation_) {
        KILN_LOG_DEBUG << "Building interpreted container with "
                       << definitions_.size() << " definitions";
        return std::make_unique<Container>(definitions_, types_, autowiring_);
    }

    const compiler::ArtifactIdentity& identity = *compilation_;

    std::shared_ptr<const compiler::ArtifactProgram> program;
    try {
        // Known classes are only enumerated when the artifact is generated;
        // an existing artifact already dispatches their entries
        program = cache.obtain_program(identity, [&] {
            DefinitionMap definitions = definitions_;
            for (const auto& known : known_classes_) {
                size_t added =
                    discovery::add_known_classes(definitions, known, *types_);
                KILN_LOG_DEBUG << "Added " << added
                               << " autowired entries from known classes";
            }
            return compiler::ContainerCompiler(types_).compile(definitions,
                                                               identity);
        });
    } catch (const ContainerError& e) {
        KILN_LOG_ERROR << "Failed to build compiled container "
                       << identity.name << " [" << to_string(e.kind())
                       << "]: " << e.what();
        throw;
    }

    auto parent = parents_.find(program->parent_type);
    if (parent == parents_.end()) {
        throw compiler::ArtifactError(
            "Compiled container " + program->container_name +
            " extends unregistered parent type " + program->parent_type);
    }

    return parent->second(CompiledContainer::Context{
        std::move(program), definitions_, types_, autowiring_});
}

}  // namespace kiln::di
