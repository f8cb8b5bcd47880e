#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "kiln/compiler/artifact_cache.hpp"
#include "kiln/compiler/instruction.hpp"

namespace kiln::compiler {

struct GeneratedRoutine {
    std::string entry_id;
    std::string routine_name;
    std::string source;
};

/**
 * @brief Writes compilation plans as resolution assembly
 *
 * An artifact looks like:
 *
 *     ; Generated by kiln. Do not edit.
 *     container app::Container extends "kiln::di::CompiledContainer"
 *
 *     routine get1
 *         push.string "bar"
 *         ret
 *     end
 *
 *     dispatch
 *         "foo" get1
 *     end
 *
 * Routines are named get1, get2, ... in generation order.
 */
class CodeGenerator {
public:
    GeneratedRoutine generate(const CompilationPlan& plan,
                              const std::string& entry_id);

    std::string assemble(const std::vector<GeneratedRoutine>& routines,
                         const ArtifactIdentity& identity) const;

    size_t generated_count() const { return counter_; }

    static std::string quote(const std::string& text);
    static std::string format_instruction(const Instruction& instruction);

private:
    size_t counter_ = 0;
};

}  // namespace kiln::compiler
