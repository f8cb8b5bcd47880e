#include "kiln/compiler/analyzer.hpp"

#include <utility>
#include <variant>

#include "kiln/di/autowiring.hpp"

namespace kiln::compiler {

using di::ArgumentBinding;
using di::Autowiring;
using di::Definition;
using di::Value;

namespace {

const char* const kObjectCause =
    "An object was found but objects cannot be compiled";
const char* const kAnonymousCause = "anonymous classes cannot be compiled";

void push_key(const di::ArrayKey& key, Code& code) {
    if (const auto* index = std::get_if<int64_t>(&key)) {
        code.push_back(Instruction::with_integer(Opcode::PUSH_INT, *index));
    } else {
        code.push_back(Instruction::with_text(Opcode::PUSH_STRING,
                                              std::get<std::string>(key)));
    }
}

CompilationPath element_path(const CompilationPath& path,
                             const di::ArrayKey& key) {
    if (std::holds_alternative<int64_t>(key)) {
        return path.extended(PathSegment::Kind::ARRAY_INDEX,
                             di::key_to_string(key));
    }
    return path.extended(PathSegment::Kind::ARRAY_KEY, di::key_to_string(key));
}

}  // namespace

CompilabilityAnalyzer::CompilabilityAnalyzer(
    std::shared_ptr<const di::TypeIntrospector> types)
    : types_(types ? std::move(types)
                   : std::make_shared<const di::TypeRegistry>()) {}

std::optional<CompilationPlan> CompilabilityAnalyzer::analyze(
    const Definition& definition, const CompilationPath& path) const {
    CompilationPlan plan{path.root(), {}};
    if (!lower(definition, path, plan.code)) {
        return std::nullopt;
    }
    plan.code.push_back(Instruction::simple(Opcode::RET));
    return plan;
}

std::optional<CompilationPlan> CompilabilityAnalyzer::analyze_entry(
    const std::string& id, const Definition& definition) const {
    return analyze(definition, CompilationPath(id));
}

bool CompilabilityAnalyzer::lower(const Definition& definition,
                                  const CompilationPath& path,
                                  Code& code) const {
    switch (definition.kind()) {
        case Definition::Kind::VALUE:
            lower_value(definition.as_value().value, path, code);
            return true;
        case Definition::Kind::ALIAS:
            code.push_back(Instruction::with_text(
                Opcode::ENTRY, definition.as_alias().target));
            return true;
        case Definition::Kind::FACTORY:
            return false;
        case Definition::Kind::CLASS:
            return lower_class(definition.as_class(), path, code);
        case Definition::Kind::ARRAY:
            return lower_array(definition.as_array(), path, code);
        case Definition::Kind::ENVIRONMENT:
            return lower_environment(definition.as_environment(), path, code);
        case Definition::Kind::STRING:
            lower_string(definition.as_string(), path, code);
            return true;
    }
    throw CompilationError(ErrorKind::UnresolvableDefinition, path,
                           "unknown definition kind");
}

void CompilabilityAnalyzer::lower_value(const Value& value,
                                        const CompilationPath& path,
                                        Code& code) const {
    switch (value.type()) {
        case Value::Type::NIL:
            code.push_back(Instruction::simple(Opcode::PUSH_NULL));
            break;
        case Value::Type::BOOL:
            code.push_back(Instruction::simple(
                value.as_bool() ? Opcode::PUSH_TRUE : Opcode::PUSH_FALSE));
            break;
        case Value::Type::INT:
            code.push_back(
                Instruction::with_integer(Opcode::PUSH_INT, value.as_int()));
            break;
        case Value::Type::FLOAT:
            code.push_back(
                Instruction::with_real(Opcode::PUSH_FLOAT, value.as_float()));
            break;
        case Value::Type::STRING:
            code.push_back(
                Instruction::with_text(Opcode::PUSH_STRING, value.as_string()));
            break;
        case Value::Type::ARRAY: {
            const di::Array& array = value.as_array();
            for (size_t i = 0; i < array.size(); ++i) {
                const di::ArrayKey& key = array.key_at(i);
                push_key(key, code);
                lower_value(array.at(i), element_path(path, key), code);
            }
            code.push_back(Instruction::with_integer(
                Opcode::ARRAY, static_cast<int64_t>(array.size())));
            break;
        }
        case Value::Type::OBJECT:
            if (di::is_anonymous_type_name(value.as_object().type_name())) {
                throw CompilationError(ErrorKind::AnonymousTypeNotCompilable,
                                       path, kAnonymousCause);
            }
            throw CompilationError(ErrorKind::ObjectNotCompilable, path,
                                   kObjectCause);
    }
}

bool CompilabilityAnalyzer::lower_class(const di::ClassDefinition& definition,
                                        const CompilationPath& path,
                                        Code& code) const {
    const std::string& class_name =
        di::effective_class_name(definition, path.root());
    if (di::is_anonymous_type_name(class_name)) {
        throw CompilationError(ErrorKind::AnonymousTypeNotCompilable, path,
                               kAnonymousCause);
    }

    const di::TypeDescriptor* type = types_->find(class_name);
    if (!type) {
        throw CompilationError(ErrorKind::UnresolvableDefinition, path,
                               "class " + class_name + " is not registered");
    }
    if (type->anonymous()) {
        throw CompilationError(ErrorKind::AnonymousTypeNotCompilable, path,
                               kAnonymousCause);
    }
    if (!type->instantiable()) {
        throw CompilationError(
            ErrorKind::UnresolvableDefinition, path,
            "class " + class_name + " has no registered constructor");
    }

    auto bindings = Autowiring::bind_constructor(definition, *type);
    if (bindings.problem) {
        throw CompilationError(ErrorKind::UnresolvableDefinition, path,
                               *bindings.problem);
    }
    if (auto problem = Autowiring::check_injections(definition, *type)) {
        throw CompilationError(ErrorKind::UnresolvableDefinition, path,
                               *problem);
    }

    for (const auto& binding : bindings.arguments) {
        auto parameter_path = path.extended(
            PathSegment::Kind::CONSTRUCTOR_PARAMETER, binding.parameter);
        switch (binding.source) {
            case ArgumentBinding::Source::EXPLICIT:
                if (!lower(*binding.definition, parameter_path, code)) {
                    return false;
                }
                break;
            case ArgumentBinding::Source::INJECTED:
                code.push_back(
                    Instruction::with_text(Opcode::ENTRY, binding.entry_id));
                break;
            case ArgumentBinding::Source::DEFAULT:
                lower_value(*binding.default_value, parameter_path, code);
                break;
        }
    }
    code.push_back(Instruction::with_text(
        Opcode::NEW, class_name,
        static_cast<int64_t>(bindings.arguments.size())));

    for (const auto& [name, value] : definition.properties) {
        if (!lower(value, path.extended(PathSegment::Kind::PROPERTY, name),
                   code)) {
            return false;
        }
        code.push_back(Instruction::with_text(Opcode::PROPERTY, name));
    }

    for (const auto& call : definition.method_calls) {
        for (size_t i = 0; i < call.arguments.size(); ++i) {
            auto argument_path =
                path.extended(PathSegment::Kind::METHOD_ARGUMENT,
                              call.method + ", argument " + std::to_string(i));
            if (!lower(call.arguments[i], argument_path, code)) {
                return false;
            }
        }
        code.push_back(Instruction::with_text(
            Opcode::CALL, call.method,
            static_cast<int64_t>(call.arguments.size())));
    }
    return true;
}

bool CompilabilityAnalyzer::lower_array(const di::ArrayDefinition& definition,
                                        const CompilationPath& path,
                                        Code& code) const {
    for (const auto& [key, element] : definition.elements) {
        push_key(key, code);
        if (!lower(element, element_path(path, key), code)) {
            return false;
        }
    }
    code.push_back(Instruction::with_integer(
        Opcode::ARRAY, static_cast<int64_t>(definition.elements.size())));
    return true;
}

bool CompilabilityAnalyzer::lower_environment(
    const di::EnvironmentDefinition& definition, const CompilationPath& path,
    Code& code) const {
    if (!definition.default_value) {
        code.push_back(
            Instruction::with_text(Opcode::ENV, definition.variable, 0));
        return true;
    }

    Code fallback;
    auto default_path = path.extended(PathSegment::Kind::ENVIRONMENT_DEFAULT,
                                      definition.variable);
    if (!lower(*definition.default_value, default_path, fallback)) {
        return false;
    }
    code.push_back(Instruction::with_text(
        Opcode::ENV, definition.variable,
        static_cast<int64_t>(fallback.size())));
    code.insert(code.end(), fallback.begin(), fallback.end());
    return true;
}

void CompilabilityAnalyzer::lower_string(
    const di::StringDefinition& definition, const CompilationPath& path,
    Code& code) const {
    std::vector<di::ExpressionPart> parts;
    try {
        parts = di::parse_string_expression(definition.expression);
    } catch (const std::invalid_argument& e) {
        throw CompilationError(ErrorKind::UnresolvableDefinition, path,
                               e.what());
    }

    for (const auto& part : parts) {
        if (part.placeholder) {
            code.push_back(Instruction::with_text(Opcode::ENTRY, part.text));
        } else {
            code.push_back(Instruction::with_text(Opcode::PUSH_STRING,
                                                  part.text));
        }
    }
    code.push_back(Instruction::with_integer(
        Opcode::CONCAT, static_cast<int64_t>(parts.size())));
}

}  // namespace kiln::compiler
