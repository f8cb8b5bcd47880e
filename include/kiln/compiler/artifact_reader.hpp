#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include "kiln/compiler/compilation_error.hpp"
#include "kiln/compiler/instruction.hpp"

namespace kiln::compiler {

/**
 * @brief A loaded artifact: its routines and the entries they serve
 */
struct ArtifactProgram {
    std::string container_name;
    std::string parent_type;
    std::vector<Routine> routines;
    // Entry id -> index into routines
    std::map<std::string, size_t> dispatch;

    // nullptr when the entry is not compiled
    const Routine* find_routine_for(const std::string& entry_id) const;
};

/**
 * @brief Parser for resolution assembly
 *
 * Checks the structure the stack machine relies on: every routine ends with
 * ret, env skips stay inside their routine, counts are not negative and the
 * dispatch table only names existing routines.
 */
class ArtifactReader {
public:
    /**
     * @param origin file name used in error messages
     * @throws ArtifactError naming the offending line
     */
    static ArtifactProgram parse(const std::string& source,
                                 const std::string& origin);
};

}  // namespace kiln::compiler
