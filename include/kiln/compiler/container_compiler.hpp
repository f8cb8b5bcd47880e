#pragma once

#include <memory>
#include <string>

#include "kiln/compiler/analyzer.hpp"
#include "kiln/compiler/artifact_cache.hpp"
#include "kiln/di/definition.hpp"

namespace kiln::compiler {

/**
 * @brief Turns a definition map into the source of a compiled container
 *
 * Entries are analyzed in identifier order. The first entry that cannot be
 * compiled aborts the whole compilation.
 */
class ContainerCompiler {
public:
    explicit ContainerCompiler(
        std::shared_ptr<const di::TypeIntrospector> types);

    /**
     * @throws InvalidArtifactNameError before any entry is analyzed
     * @throws CompilationError for the first entry that cannot be compiled
     */
    std::string compile(const di::DefinitionMap& definitions,
                        const ArtifactIdentity& identity) const;

private:
    CompilabilityAnalyzer analyzer_;
};

}  // namespace kiln::compiler
