#pragma once

#include <memory>
#include <string>
#include <vector>

#include "kiln/compiler/artifact_reader.hpp"
#include "kiln/di/container.hpp"

namespace kiln::di {

/**
 * @brief Container serving compiled entries from a loaded artifact
 *
 * Entries listed in the artifact's dispatch table are produced by running
 * their routine; every other identifier goes through the interpreted
 * resolution of the base class. Definitions cannot be changed at runtime.
 *
 * Subclasses used as a custom parent must be constructible from a Context
 * and registered with ContainerBuilder::register_parent().
 */
class CompiledContainer : public Container {
public:
    static constexpr const char* TYPE_NAME = "kiln::di::CompiledContainer";

    struct Context {
        std::shared_ptr<const compiler::ArtifactProgram> program;
        DefinitionMap definitions;
        std::shared_ptr<const TypeIntrospector> types;
        bool autowiring = true;
    };

    explicit CompiledContainer(Context context);

    bool has(const std::string& id) const override;

    /**
     * @throws ContainerImmutableError always
     */
    void set(const std::string& id, Definition definition) override;

    bool is_entry_compiled(const std::string& id) const;
    std::vector<std::string> compiled_entries() const;

    const std::string& compiled_name() const {
        return program_->container_name;
    }
    const std::string& parent_type() const { return program_->parent_type; }

protected:
    Value resolve(const std::string& id) override;

private:
    Value execute(const compiler::Routine& routine,
                  const std::string& entry_id);

    std::shared_ptr<const compiler::ArtifactProgram> program_;
};

}  // namespace kiln::di
