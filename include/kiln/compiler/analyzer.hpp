#pragma once

#include <memory>
#include <optional>
#include <string>

#include "kiln/compiler/compilation_error.hpp"
#include "kiln/compiler/instruction.hpp"
#include "kiln/di/definition.hpp"
#include "kiln/di/type_registry.hpp"

namespace kiln::compiler {

/**
 * @brief Decides whether a definition can be turned into a routine
 *
 * Walks the definition tree and lowers it to stack machine instructions.
 * A factory anywhere in the tree leaves the entry to the interpreted
 * container. Any other node that cannot be lowered (live objects, anonymous
 * types, unresolvable class construction) aborts with a CompilationError
 * carrying the path to that node.
 *
 * The analyzer only reads the definition and the type introspector.
 */
class CompilabilityAnalyzer {
public:
    explicit CompilabilityAnalyzer(
        std::shared_ptr<const di::TypeIntrospector> types);

    /**
     * @brief Lower a definition found at `path`
     * @return nullopt when the definition must stay interpreted
     * @throws CompilationError when the definition cannot be compiled
     */
    std::optional<CompilationPlan> analyze(const di::Definition& definition,
                                           const CompilationPath& path) const;

    std::optional<CompilationPlan> analyze_entry(
        const std::string& id, const di::Definition& definition) const;

private:
    bool lower(const di::Definition& definition, const CompilationPath& path,
               Code& code) const;
    void lower_value(const di::Value& value, const CompilationPath& path,
                     Code& code) const;
    bool lower_class(const di::ClassDefinition& definition,
                     const CompilationPath& path, Code& code) const;
    bool lower_array(const di::ArrayDefinition& definition,
                     const CompilationPath& path, Code& code) const;
    bool lower_environment(const di::EnvironmentDefinition& definition,
                           const CompilationPath& path, Code& code) const;
    void lower_string(const di::StringDefinition& definition,
                      const CompilationPath& path, Code& code) const;

    std::shared_ptr<const di::TypeIntrospector> types_;
};

}  // namespace kiln::compiler
