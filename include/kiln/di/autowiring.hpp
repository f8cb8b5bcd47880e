#pragma once

#include <optional>
#include <string>
#include <vector>

#include "kiln/di/definition.hpp"
#include "kiln/di/type_registry.hpp"

namespace kiln::di {

/**
 * @brief Where the value of one constructor parameter comes from
 */
struct ArgumentBinding {
    enum class Source { EXPLICIT, INJECTED, DEFAULT };

    Source source;
    std::string parameter;
    const Definition* definition = nullptr;  // EXPLICIT
    std::string entry_id;                    // INJECTED
    const Value* default_value = nullptr;    // DEFAULT
};

struct ConstructorBindings {
    std::vector<ArgumentBinding> arguments;
    // Set when the constructor cannot be satisfied
    std::optional<std::string> problem;
};

/**
 * @brief Matches a class definition against its registered type. Shared by
 * the interpreted container and the compiler so both construct objects from
 * the same argument sources in the same order.
 */
class Autowiring {
public:
    static ConstructorBindings bind_constructor(
        const ClassDefinition& definition, const TypeDescriptor& type);

    // Property and method names the type does not expose, if any
    static std::optional<std::string> check_injections(
        const ClassDefinition& definition, const TypeDescriptor& type);

    // Synthetic definition for a type resolved without an explicit entry
    static Definition definition_for(const std::string& class_name);
};

}  // namespace kiln::di
