// tests/compiler/test_analyzer.cpp
#define BOOST_TEST_MODULE analyzer_tests
#include <boost/test/unit_test.hpp>
#include <memory>
#include <stdexcept>
#include <string>

#include "../support/sample_types.hpp"
#include "kiln/compiler/analyzer.hpp"
#include "kiln/di/dsl.hpp"

using namespace kiln::compiler;
using namespace kiln::di::dsl;
using kiln::di::Array;
using kiln::di::Definition;
using kiln::di::ErrorKind;
using kiln::di::Value;

namespace {

struct AnalyzerFixture {
    CompilabilityAnalyzer analyzer{make_sample_registry()};

    Code lower(const std::string& id, const Definition& definition) {
        auto plan = analyzer.analyze_entry(id, definition);
        BOOST_REQUIRE(plan.has_value());
        BOOST_CHECK_EQUAL(plan->entry_id, id);
        return plan->code;
    }

    // Expect a CompilationError and return it for inspection
    CompilationError failure(const std::string& id,
                             const Definition& definition) {
        try {
            analyzer.analyze_entry(id, definition);
        } catch (const CompilationError& e) {
            return e;
        }
        BOOST_FAIL("Expected CompilationError for entry " << id);
        throw std::logic_error("unreachable");
    }
};

Instruction text(Opcode op, const std::string& value, int64_t integer = 0) {
    return Instruction::with_text(op, value, integer);
}

Instruction integer(Opcode op, int64_t value) {
    return Instruction::with_integer(op, value);
}

Instruction simple(Opcode op) { return Instruction::simple(op); }

}  // namespace

BOOST_FIXTURE_TEST_SUITE(analyzer_suite, AnalyzerFixture)

BOOST_AUTO_TEST_CASE(test_scalar_values) {
    BOOST_CHECK(lower("s", "bar") ==
                Code({text(Opcode::PUSH_STRING, "bar"), simple(Opcode::RET)}));
    BOOST_CHECK(lower("i", 42) ==
                Code({integer(Opcode::PUSH_INT, 42), simple(Opcode::RET)}));
    BOOST_CHECK(lower("f", 1.25) ==
                Code({Instruction::with_real(Opcode::PUSH_FLOAT, 1.25),
                      simple(Opcode::RET)}));
    BOOST_CHECK(lower("b", true) ==
                Code({simple(Opcode::PUSH_TRUE), simple(Opcode::RET)}));
    BOOST_CHECK(lower("n", nullptr) ==
                Code({simple(Opcode::PUSH_NULL), simple(Opcode::RET)}));
}

BOOST_AUTO_TEST_CASE(test_alias_becomes_entry_lookup) {
    BOOST_CHECK(lower("host", get("db.host")) ==
                Code({text(Opcode::ENTRY, "db.host"), simple(Opcode::RET)}));
}

BOOST_AUTO_TEST_CASE(test_array_pushes_keys_then_values) {
    Code expected{
        integer(Opcode::PUSH_INT, 0),   text(Opcode::PUSH_STRING, "a"),
        integer(Opcode::PUSH_INT, 1),   text(Opcode::ENTRY, "b"),
        integer(Opcode::ARRAY, 2),      simple(Opcode::RET),
    };
    BOOST_CHECK(lower("list", array({"a", get("b")})) == expected);

    Code expected_map{
        text(Opcode::PUSH_STRING, "x"), integer(Opcode::PUSH_INT, 1),
        integer(Opcode::ARRAY, 1),      simple(Opcode::RET),
    };
    BOOST_CHECK(lower("map", Value(Array::map({{"x", 1}}))) == expected_map);
}

BOOST_AUTO_TEST_CASE(test_class_injection_order) {
    auto definition = create("sample::Mailer")
                          .constructor({get("transport"), "ops@example.com"})
                          .property("retries", 3)
                          .method("add_recipient", {"alice@example.com"});

    Code expected{
        text(Opcode::ENTRY, "transport"),
        text(Opcode::PUSH_STRING, "ops@example.com"),
        text(Opcode::NEW, "sample::Mailer", 2),
        integer(Opcode::PUSH_INT, 3),
        text(Opcode::PROPERTY, "retries"),
        text(Opcode::PUSH_STRING, "alice@example.com"),
        text(Opcode::CALL, "add_recipient", 1),
        simple(Opcode::RET),
    };
    BOOST_CHECK(lower("mailer", definition) == expected);
}

BOOST_AUTO_TEST_CASE(test_autowired_parameters_are_injected_by_id) {
    Code expected{
        text(Opcode::ENTRY, "sample::Transport"),
        text(Opcode::PUSH_STRING, "noreply@example.com"),
        text(Opcode::NEW, "sample::Mailer", 2),
        simple(Opcode::RET),
    };
    BOOST_CHECK(lower("sample::Mailer", autowire()) == expected);
}

BOOST_AUTO_TEST_CASE(test_environment_with_default_block) {
    Code expected{
        text(Opcode::ENV, "DB_PORT", 1),
        integer(Opcode::PUSH_INT, 5432),
        simple(Opcode::RET),
    };
    BOOST_CHECK(lower("port", env("DB_PORT", 5432)) == expected);

    Code required{text(Opcode::ENV, "DB_HOST", 0), simple(Opcode::RET)};
    BOOST_CHECK(lower("host", env("DB_HOST")) == required);
}

BOOST_AUTO_TEST_CASE(test_string_expression_lowered_to_concat) {
    Code expected{
        text(Opcode::PUSH_STRING, "pgsql://"),
        text(Opcode::ENTRY, "host"),
        text(Opcode::PUSH_STRING, ":"),
        text(Opcode::ENTRY, "port"),
        integer(Opcode::CONCAT, 4),
        simple(Opcode::RET),
    };
    BOOST_CHECK(lower("dsn", string("pgsql://{host}:{port}")) == expected);
}

BOOST_AUTO_TEST_CASE(test_factory_anywhere_leaves_entry_interpreted) {
    auto make_one = factory([](kiln::di::Container&) { return Value(1); });

    BOOST_CHECK(!analyzer.analyze_entry("f", make_one).has_value());
    BOOST_CHECK(!analyzer.analyze_entry("list", array({1, make_one}))
                     .has_value());
    BOOST_CHECK(!analyzer
                     .analyze_entry("transport",
                                    create("sample::Transport")
                                        .property("port", make_one))
                     .has_value());
    BOOST_CHECK(!analyzer.analyze_entry("port", env("PORT", make_one))
                     .has_value());
}

BOOST_AUTO_TEST_CASE(test_object_value_at_entry_level) {
    auto error = failure(
        "stdObject", Value::object(std::make_shared<sample::Transport>()));

    BOOST_CHECK(error.kind() == ErrorKind::ObjectNotCompilable);
    BOOST_CHECK(error.innermost_kind() == ErrorKind::ObjectNotCompilable);
    BOOST_CHECK_EQUAL(error.what(),
                      "Entry \"stdObject\" cannot be compiled: An object was "
                      "found but objects cannot be compiled");
}

BOOST_AUTO_TEST_CASE(test_nested_failures_keep_path) {
    auto object = Value::object(std::make_shared<sample::Transport>());

    auto in_constructor = failure(
        "mailer", create("sample::Mailer").constructor({object}));
    BOOST_CHECK(in_constructor.kind() == ErrorKind::NestedCompilationFailure);
    BOOST_CHECK_EQUAL(in_constructor.path().render(),
                      "mailer -> parameter 'transport'");

    auto in_method = failure("mailer", autowire("sample::Mailer")
                                           .method("add_recipient", {object}));
    BOOST_CHECK_EQUAL(in_method.path().render(),
                      "mailer -> method add_recipient, argument 0");

    auto in_default =
        failure("port", env("PORT", array_map({{"fallback", object}})));
    BOOST_CHECK_EQUAL(in_default.path().render(),
                      "port -> default of 'PORT' -> fallback");
    BOOST_CHECK_EQUAL(in_default.what(),
                      "Error while compiling port. Error while compiling "
                      "<nested definition>. An object was found but objects "
                      "cannot be compiled [port -> default of 'PORT' -> "
                      "fallback]");
}

BOOST_AUTO_TEST_CASE(test_anonymous_types) {
    const std::string hidden = kiln::di::type_name_of<sample::Hidden>();

    auto error = failure("hidden", create(hidden));
    BOOST_CHECK(error.kind() == ErrorKind::AnonymousTypeNotCompilable);

    auto nested = failure("list", array({create(hidden)}));
    BOOST_CHECK(nested.kind() == ErrorKind::NestedCompilationFailure);
    BOOST_CHECK(nested.innermost_kind() ==
                ErrorKind::AnonymousTypeNotCompilable);
    BOOST_CHECK_EQUAL(nested.cause(), "anonymous classes cannot be compiled");
}

BOOST_AUTO_TEST_CASE(test_unresolvable_class_construction) {
    BOOST_CHECK(failure("x", create("app::Unknown")).kind() ==
                ErrorKind::UnresolvableDefinition);
    BOOST_CHECK(failure("x", create("sample::Abstract")).kind() ==
                ErrorKind::UnresolvableDefinition);
    BOOST_CHECK(failure("x", create("sample::Mailer")).kind() ==
                ErrorKind::UnresolvableDefinition);
    BOOST_CHECK(failure("x", create("sample::Transport").constructor({1}))
                    .kind() == ErrorKind::UnresolvableDefinition);
    BOOST_CHECK(failure("x", create("sample::Transport").property("tls", 1))
                    .kind() == ErrorKind::UnresolvableDefinition);
    BOOST_CHECK(failure("x", create("sample::Mailer")
                                 .constructor({get("t")})
                                 .method("add_recipient"))
                    .kind() == ErrorKind::UnresolvableDefinition);
    BOOST_CHECK(failure("x", string("{open")).kind() ==
                ErrorKind::UnresolvableDefinition);
}

BOOST_AUTO_TEST_CASE(test_analysis_without_entry_path) {
    auto plan = analyzer.analyze(Definition("bar"), CompilationPath());
    BOOST_REQUIRE(plan.has_value());

    try {
        analyzer.analyze(Value::object(std::make_shared<sample::Transport>()),
                         CompilationPath());
        BOOST_FAIL("Expected CompilationError");
    } catch (const CompilationError& e) {
        BOOST_CHECK_EQUAL(e.entry_id(), "<definition>");
    }
}

BOOST_AUTO_TEST_SUITE_END()
