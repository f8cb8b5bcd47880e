#include "kiln/compiler/container_compiler.hpp"

#include <utility>
#include <vector>

#include "kiln/compiler/code_generator.hpp"
#include "kiln/log/logger.hpp"

namespace kiln::compiler {

ContainerCompiler::ContainerCompiler(
    std::shared_ptr<const di::TypeIntrospector> types)
    : analyzer_(std::move(types)) {}

std::string ContainerCompiler::compile(const di::DefinitionMap& definitions,
                                       const ArtifactIdentity& identity) const {
    ArtifactCache::validate_name(identity.name);

    CodeGenerator generator;
    std::vector<GeneratedRoutine> routines;
    size_t skipped = 0;

    for (const auto& [id, definition] : definitions) {
        auto plan = analyzer_.analyze_entry(id, definition);
        if (!plan) {
            KILN_LOG_DEBUG << "Entry '" << id
                           << "' is left to the interpreted container ("
                           << definition.describe() << ")";
            ++skipped;
            continue;
        }
        routines.push_back(generator.generate(*plan, id));
    }

    KILN_LOG_INFO << "Compiling container " << identity.name << ": "
                  << routines.size() << " entries compiled, " << skipped
                  << " interpreted";
    return generator.assemble(routines, identity);
}

}  // namespace kiln::compiler
