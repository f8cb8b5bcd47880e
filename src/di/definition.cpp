#include "kiln/di/definition.hpp"

#include <stdexcept>

namespace kiln::di {

namespace {

[[noreturn]] void throw_kind_mismatch(const char* expected,
                                      const Definition& actual) {
    throw std::invalid_argument(std::string("definition is not a ") +
                                expected + " (" + actual.describe() + ")");
}

}  // namespace

Definition Definition::alias(std::string target) {
    return Definition(Node(AliasDefinition{std::move(target)}));
}

Definition Definition::factory(FactoryFunction factory) {
    return Definition(Node(FactoryDefinition{std::move(factory)}));
}

Definition Definition::of_class(ClassDefinition definition) {
    return Definition(Node(
        std::make_shared<const ClassDefinition>(std::move(definition))));
}

Definition Definition::array(ArrayDefinition definition) {
    return Definition(Node(
        std::make_shared<const ArrayDefinition>(std::move(definition))));
}

Definition Definition::environment(EnvironmentDefinition definition) {
    return Definition(Node(
        std::make_shared<const EnvironmentDefinition>(std::move(definition))));
}

Definition Definition::string(std::string expression) {
    return Definition(Node(StringDefinition{std::move(expression)}));
}

const ValueDefinition& Definition::as_value() const {
    if (kind() != Kind::VALUE) throw_kind_mismatch("value", *this);
    return std::get<ValueDefinition>(node_);
}

const AliasDefinition& Definition::as_alias() const {
    if (kind() != Kind::ALIAS) throw_kind_mismatch("alias", *this);
    return std::get<AliasDefinition>(node_);
}

const FactoryDefinition& Definition::as_factory() const {
    if (kind() != Kind::FACTORY) throw_kind_mismatch("factory", *this);
    return std::get<FactoryDefinition>(node_);
}

const ClassDefinition& Definition::as_class() const {
    if (kind() != Kind::CLASS) throw_kind_mismatch("class", *this);
    return *std::get<std::shared_ptr<const ClassDefinition>>(node_);
}

const ArrayDefinition& Definition::as_array() const {
    if (kind() != Kind::ARRAY) throw_kind_mismatch("array", *this);
    return *std::get<std::shared_ptr<const ArrayDefinition>>(node_);
}

const EnvironmentDefinition& Definition::as_environment() const {
    if (kind() != Kind::ENVIRONMENT) {
        throw_kind_mismatch("environment", *this);
    }
    return *std::get<std::shared_ptr<const EnvironmentDefinition>>(node_);
}

const StringDefinition& Definition::as_string() const {
    if (kind() != Kind::STRING) throw_kind_mismatch("string", *this);
    return std::get<StringDefinition>(node_);
}

std::string Definition::describe() const {
    switch (kind()) {
        case Kind::VALUE:
            return "value " + as_value().value.debug_string();
        case Kind::ALIAS:
            return "alias to '" + as_alias().target + "'";
        case Kind::FACTORY:
            return "factory";
        case Kind::CLASS: {
            const auto& name = as_class().class_name;
            return "object " + (name.empty() ? std::string("<entry>") : name);
        }
        case Kind::ARRAY:
            return "array of " + std::to_string(as_array().elements.size());
        case Kind::ENVIRONMENT:
            return "environment variable " + as_environment().variable;
        case Kind::STRING:
            return "string \"" + as_string().expression + "\"";
    }
    return "unknown";
}

std::vector<ExpressionPart> parse_string_expression(
    const std::string& expression) {
    std::vector<ExpressionPart> parts;
    std::string literal;

    for (size_t pos = 0; pos < expression.size();) {
        char c = expression[pos];
        if (c == '}') {
            throw std::invalid_argument("unexpected '}' at offset " +
                                        std::to_string(pos) + " in \"" +
                                        expression + "\"");
        }
        if (c != '{') {
            literal += c;
            ++pos;
            continue;
        }

        auto close = expression.find('}', pos + 1);
        if (close == std::string::npos) {
            throw std::invalid_argument("unclosed '{' in \"" + expression +
                                        "\"");
        }
        std::string name = expression.substr(pos + 1, close - pos - 1);
        if (name.empty() || name.find('{') != std::string::npos) {
            throw std::invalid_argument("invalid placeholder in \"" +
                                        expression + "\"");
        }
        if (!literal.empty()) {
            parts.push_back({false, std::move(literal)});
            literal.clear();
        }
        parts.push_back({true, std::move(name)});
        pos = close + 1;
    }

    if (!literal.empty()) {
        parts.push_back({false, std::move(literal)});
    }
    return parts;
}

const std::string& effective_class_name(const ClassDefinition& definition,
                                        const std::string& entry_id) {
    return definition.class_name.empty() ? entry_id : definition.class_name;
}

}  // namespace kiln::di
