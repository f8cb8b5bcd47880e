#pragma once

#include <initializer_list>
#include <string>
#include <utility>
#include <vector>

#include "kiln/di/definition.hpp"

namespace kiln::di::dsl {

/**
 * @brief Fluent builder for class construction definitions
 *
 * create("app::Mailer").constructor({get("transport"), "noreply@x"})
 *                      .property("port", 25)
 *                      .method("add_recipient", {"ops@x"})
 */
class ClassDefinitionHelper {
public:
    ClassDefinitionHelper(std::string class_name, bool autowired) {
        definition_.class_name = std::move(class_name);
        definition_.autowired = autowired;
    }

    ClassDefinitionHelper& constructor(std::vector<Definition> arguments) {
        definition_.constructor_arguments = std::move(arguments);
        return *this;
    }

    ClassDefinitionHelper& property(std::string name, Definition value) {
        definition_.properties.emplace_back(std::move(name), std::move(value));
        return *this;
    }

    ClassDefinitionHelper& method(std::string name,
                                  std::vector<Definition> arguments = {}) {
        definition_.method_calls.push_back(
            {std::move(name), std::move(arguments)});
        return *this;
    }

    Definition definition() const { return Definition::of_class(definition_); }
    operator Definition() const { return definition(); }

private:
    ClassDefinition definition_;
};

inline Definition value(Value v) { return Definition(std::move(v)); }

// Reference to another entry
inline Definition get(std::string id) {
    return Definition::alias(std::move(id));
}

inline Definition factory(FactoryFunction fn) {
    return Definition::factory(std::move(fn));
}

inline Definition env(std::string variable) {
    return Definition::environment({std::move(variable), std::nullopt});
}

inline Definition env(std::string variable, Definition default_value) {
    return Definition::environment(
        {std::move(variable), std::move(default_value)});
}

inline Definition string(std::string expression) {
    return Definition::string(std::move(expression));
}

// List of definitions, keyed 0..n-1
inline Definition array(std::initializer_list<Definition> elements) {
    ArrayDefinition definition;
    int64_t index = 0;
    for (const auto& element : elements) {
        definition.elements.emplace_back(index++, element);
    }
    return Definition::array(std::move(definition));
}

inline Definition array_map(
    std::initializer_list<std::pair<std::string, Definition>> elements) {
    ArrayDefinition definition;
    for (const auto& [key, element] : elements) {
        definition.elements.emplace_back(key, element);
    }
    return Definition::array(std::move(definition));
}

inline ClassDefinitionHelper create(std::string class_name = "") {
    return ClassDefinitionHelper(std::move(class_name), false);
}

template <typename T>
ClassDefinitionHelper create() {
    return ClassDefinitionHelper(type_name_of<T>(), false);
}

inline ClassDefinitionHelper autowire(std::string class_name = "") {
    return ClassDefinitionHelper(std::move(class_name), true);
}

template <typename T>
ClassDefinitionHelper autowire() {
    return ClassDefinitionHelper(type_name_of<T>(), true);
}

}  // namespace kiln::di::dsl
