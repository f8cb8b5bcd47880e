#pragma once

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "kiln/di/value.hpp"

namespace kiln::di {

class Container;
class Definition;
struct ClassDefinition;
struct ArrayDefinition;
struct EnvironmentDefinition;

using FactoryFunction = std::function<Value(Container&)>;

struct ValueDefinition {
    Value value;
};

struct AliasDefinition {
    std::string target;
};

struct FactoryDefinition {
    FactoryFunction factory;
};

// "{host}:{port}" -> string value of entries "host" and "port"
struct StringDefinition {
    std::string expression;
};

/**
 * @brief Immutable description of how to produce the value of an entry
 *
 * Nested nodes (class construction, arrays, environment defaults) are shared
 * and never modified once built, so copying a Definition is cheap.
 */
class Definition {
public:
    enum class Kind { VALUE, ALIAS, FACTORY, CLASS, ARRAY, ENVIRONMENT, STRING };

    // Any raw value is a value definition: {"foo", "bar"}, {"port", 25}
    template <typename T,
              std::enable_if_t<
                  std::is_constructible_v<Value, T&&> &&
                      !std::is_same_v<std::decay_t<T>, Definition>,
                  int> = 0>
    Definition(T&& value)
        : node_(ValueDefinition{Value(std::forward<T>(value))}) {}

    static Definition alias(std::string target);
    static Definition factory(FactoryFunction factory);
    static Definition of_class(ClassDefinition definition);
    static Definition array(ArrayDefinition definition);
    static Definition environment(EnvironmentDefinition definition);
    static Definition string(std::string expression);

    Kind kind() const { return static_cast<Kind>(node_.index()); }

    const ValueDefinition& as_value() const;
    const AliasDefinition& as_alias() const;
    const FactoryDefinition& as_factory() const;
    const ClassDefinition& as_class() const;
    const ArrayDefinition& as_array() const;
    const EnvironmentDefinition& as_environment() const;
    const StringDefinition& as_string() const;

    // Short description for log output
    std::string describe() const;

private:
    using Node = std::variant<ValueDefinition, AliasDefinition,
                              FactoryDefinition,
                              std::shared_ptr<const ClassDefinition>,
                              std::shared_ptr<const ArrayDefinition>,
                              std::shared_ptr<const EnvironmentDefinition>,
                              StringDefinition>;

    explicit Definition(Node node) : node_(std::move(node)) {}

    Node node_;
};

struct MethodCall {
    std::string method;
    std::vector<Definition> arguments;
};

/**
 * @brief Construction of a registered type
 *
 * Injection order is constructor arguments, then properties, then method
 * calls. An empty class_name means "the entry identifier is the class".
 * When autowired, constructor parameters not given explicitly are filled from
 * the type's registered parameter information.
 */
struct ClassDefinition {
    std::string class_name;
    std::vector<Definition> constructor_arguments;
    std::vector<std::pair<std::string, Definition>> properties;
    std::vector<MethodCall> method_calls;
    bool autowired = false;
};

struct ArrayDefinition {
    std::vector<std::pair<ArrayKey, Definition>> elements;
};

struct EnvironmentDefinition {
    std::string variable;
    std::optional<Definition> default_value;
};

// Entries by identifier, iterated in identifier order
using DefinitionMap = std::map<std::string, Definition>;

/**
 * @brief One piece of a string expression: literal text or a placeholder
 */
struct ExpressionPart {
    bool placeholder = false;
    std::string text;
};

/**
 * @brief Split "{a}.{b}" into literal and placeholder parts
 * @throws std::invalid_argument on an unbalanced or empty placeholder
 */
std::vector<ExpressionPart> parse_string_expression(
    const std::string& expression);

// Class named by a definition, falling back to the entry identifier
const std::string& effective_class_name(const ClassDefinition& definition,
                                        const std::string& entry_id);

}  // namespace kiln::di
