#include "kiln/di/autowiring.hpp"

namespace kiln::di {

ConstructorBindings Autowiring::bind_constructor(
    const ClassDefinition& definition, const TypeDescriptor& type) {
    ConstructorBindings bindings;
    const auto& parameters = type.parameters();
    const auto& explicit_arguments = definition.constructor_arguments;

    if (explicit_arguments.size() > parameters.size()) {
        bindings.problem = "the constructor of " + type.name() + " takes " +
                           std::to_string(parameters.size()) +
                           " parameters but " +
                           std::to_string(explicit_arguments.size()) +
                           " were given";
        return bindings;
    }

    for (size_t i = 0; i < parameters.size(); ++i) {
        const ParameterInfo& parameter = parameters[i];
        ArgumentBinding binding{ArgumentBinding::Source::EXPLICIT,
                                parameter.name};

        if (i < explicit_arguments.size()) {
            binding.definition = &explicit_arguments[i];
        } else if (definition.autowired && !parameter.inject.empty()) {
            binding.source = ArgumentBinding::Source::INJECTED;
            binding.entry_id = parameter.inject;
        } else if (parameter.default_value) {
            binding.source = ArgumentBinding::Source::DEFAULT;
            binding.default_value = &*parameter.default_value;
        } else {
            bindings.problem = "parameter '" + parameter.name + "' of " +
                               type.name() +
                               " has no value defined or guessable";
            return bindings;
        }
        bindings.arguments.push_back(std::move(binding));
    }
    return bindings;
}

std::optional<std::string> Autowiring::check_injections(
    const ClassDefinition& definition, const TypeDescriptor& type) {
    for (const auto& [name, value] : definition.properties) {
        if (!type.has_property(name)) {
            return "class " + type.name() + " has no injectable property '" +
                   name + "'";
        }
    }
    for (const auto& call : definition.method_calls) {
        const auto* method = type.find_method(call.method);
        if (!method) {
            return "class " + type.name() + " has no method '" + call.method +
                   "'";
        }
        if (method->arity != call.arguments.size()) {
            return "method " + type.name() + "::" + call.method +
                   " expects " + std::to_string(method->arity) +
                   " arguments, " + std::to_string(call.arguments.size()) +
                   " given";
        }
    }
    return std::nullopt;
}

Definition Autowiring::definition_for(const std::string& class_name) {
    ClassDefinition definition;
    definition.class_name = class_name;
    definition.autowired = true;
    return Definition::of_class(std::move(definition));
}

}  // namespace kiln::di
