#include "kiln/di/container.hpp"

#include <cstdlib>

#include "kiln/di/autowiring.hpp"
#include "kiln/log/logger.hpp"

namespace kiln::di {

Container::Container(DefinitionMap definitions,
                     std::shared_ptr<const TypeIntrospector> types,
                     bool autowiring)
    : definitions_(std::move(definitions)),
      types_(types ? std::move(types)
                   : std::make_shared<const TypeRegistry>()),
      autowiring_(autowiring) {}

Value Container::get(const std::string& id) {
    if (auto it = resolved_.find(id); it != resolved_.end()) {
        return it->second;
    }

    ResolutionGuard guard(context_, id);
    Value value = resolve(id);
    resolved_.insert_or_assign(id, value);
    return value;
}

Value Container::make(const std::string& id) {
    ResolutionGuard guard(context_, id);
    return resolve(id);
}

bool Container::has(const std::string& id) const {
    return resolved_.count(id) > 0 || definitions_.count(id) > 0 ||
           is_autowirable(id);
}

void Container::set(const std::string& id, Definition definition) {
    definitions_.insert_or_assign(id, std::move(definition));
    resolved_.erase(id);
}

void Container::set_value(const std::string& id, Value value) {
    resolved_.insert_or_assign(id, std::move(value));
}

std::vector<std::string> Container::defined_entries() const {
    std::vector<std::string> ids;
    ids.reserve(definitions_.size());
    for (const auto& [id, definition] : definitions_) {
        ids.push_back(id);
    }
    return ids;
}

const Definition* Container::find_definition(const std::string& id) const {
    auto it = definitions_.find(id);
    return it != definitions_.end() ? &it->second : nullptr;
}

bool Container::is_autowirable(const std::string& id) const {
    if (!autowiring_) {
        return false;
    }
    const TypeDescriptor* type = types_->find(id);
    return type != nullptr && type->instantiable();
}

Value Container::resolve(const std::string& id) {
    if (const Definition* definition = find_definition(id)) {
        return resolve_definition(*definition, id);
    }
    if (is_autowirable(id)) {
        KILN_LOG_TRACE << "Autowiring entry '" << id << "'";
        return resolve_definition(Autowiring::definition_for(id), id);
    }
    throw NotFoundError(id);
}

Value Container::resolve_definition(const Definition& definition,
                                    const std::string& entry_id) {
    switch (definition.kind()) {
        case Definition::Kind::VALUE:
            return definition.as_value().value;
        case Definition::Kind::ALIAS:
            return get(definition.as_alias().target);
        case Definition::Kind::FACTORY:
            return definition.as_factory().factory(*this);
        case Definition::Kind::CLASS:
            return resolve_class(definition.as_class(), entry_id);
        case Definition::Kind::ARRAY:
            return resolve_array(definition.as_array(), entry_id);
        case Definition::Kind::ENVIRONMENT:
            return resolve_environment(definition.as_environment(), entry_id);
        case Definition::Kind::STRING:
            return resolve_string(definition.as_string(), entry_id);
    }
    throw DependencyError("Entry '" + entry_id +
                          "' has an unknown definition kind");
}

Value Container::resolve_class(const ClassDefinition& definition,
                               const std::string& entry_id) {
    const std::string& class_name = effective_class_name(definition, entry_id);
    const TypeDescriptor* type = types_->find(class_name);
    if (!type) {
        throw DependencyError("Entry '" + entry_id +
                              "' cannot be resolved: class " + class_name +
                              " is not registered");
    }

    ConstructorBindings bindings =
        Autowiring::bind_constructor(definition, *type);
    if (bindings.problem) {
        throw DependencyError("Entry '" + entry_id +
                              "' cannot be resolved: " + *bindings.problem);
    }
    if (auto problem = Autowiring::check_injections(definition, *type)) {
        throw DependencyError("Entry '" + entry_id +
                              "' cannot be resolved: " + *problem);
    }

    std::vector<Value> arguments;
    arguments.reserve(bindings.arguments.size());
    for (const auto& binding : bindings.arguments) {
        switch (binding.source) {
            case ArgumentBinding::Source::EXPLICIT:
                arguments.push_back(
                    resolve_definition(*binding.definition, entry_id));
                break;
            case ArgumentBinding::Source::INJECTED:
                arguments.push_back(get(binding.entry_id));
                break;
            case ArgumentBinding::Source::DEFAULT:
                arguments.push_back(*binding.default_value);
                break;
        }
    }

    Value instance = attribute_errors(
        entry_id, [&] { return type->instantiate(arguments); });
    const Object& object = instance.as_object();

    for (const auto& [name, value_definition] : definition.properties) {
        Value value = resolve_definition(value_definition, entry_id);
        attribute_errors(entry_id,
                         [&] { type->set_property(object, name, value); });
    }

    for (const auto& call : definition.method_calls) {
        std::vector<Value> call_arguments;
        call_arguments.reserve(call.arguments.size());
        for (const auto& argument : call.arguments) {
            call_arguments.push_back(resolve_definition(argument, entry_id));
        }
        attribute_errors(entry_id, [&] {
            type->call_method(object, call.method, call_arguments);
        });
    }

    return instance;
}

Value Container::resolve_array(const ArrayDefinition& definition,
                               const std::string& entry_id) {
    Array array;
    for (const auto& [key, element] : definition.elements) {
        array.set(key, resolve_definition(element, entry_id));
    }
    return Value(std::move(array));
}

Value Container::resolve_environment(const EnvironmentDefinition& definition,
                                     const std::string& entry_id) {
    if (const char* value = std::getenv(definition.variable.c_str())) {
        return Value(std::string(value));
    }
    if (definition.default_value) {
        return resolve_definition(*definition.default_value, entry_id);
    }
    throw DependencyError("Entry '" + entry_id +
                          "' cannot be resolved: environment variable '" +
                          definition.variable + "' is not defined");
}

Value Container::resolve_string(const StringDefinition& definition,
                                const std::string& entry_id) {
    auto parts = attribute_errors(entry_id, [&] {
        return parse_string_expression(definition.expression);
    });

    std::string result;
    for (const auto& part : parts) {
        if (part.placeholder) {
            Value value = get(part.text);
            result +=
                attribute_errors(entry_id, [&] { return value.to_string(); });
        } else {
            result += part.text;
        }
    }
    return Value(std::move(result));
}

}  // namespace kiln::di
