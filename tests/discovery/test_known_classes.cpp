// tests/discovery/test_known_classes.cpp
#define BOOST_TEST_MODULE known_classes_tests
#include <boost/test/unit_test.hpp>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "../support/sample_types.hpp"
#include "kiln/discovery/known_classes.hpp"

using namespace kiln::discovery;
using kiln::di::Definition;
using kiln::di::DefinitionMap;

namespace {

std::vector<std::string> collect(const KnownClasses& known) {
    std::vector<std::string> names;
    known.for_each([&](const std::string& name) { names.push_back(name); });
    return names;
}

// Yields the given names one by one and counts how often it is pulled
struct CountingGenerator {
    std::vector<std::string> names;
    int* pulls;
    size_t next = 0;

    std::optional<std::string> operator()() {
        ++*pulls;
        if (next == names.size()) {
            return std::nullopt;
        }
        return names[next++];
    }
};

}  // namespace

BOOST_AUTO_TEST_SUITE(known_classes_suite)

BOOST_AUTO_TEST_CASE(test_empty_by_default) {
    BOOST_CHECK(collect(KnownClasses()).empty());
}

BOOST_AUTO_TEST_CASE(test_from_list_and_range) {
    const std::vector<std::string> names{"sample::Transport", "sample::Mailer"};

    BOOST_CHECK(collect(KnownClasses::from_list(names)) == names);

    std::set<std::string> sorted(names.begin(), names.end());
    auto from_range = collect(KnownClasses::from_range(sorted.begin(),
                                                       sorted.end()));
    BOOST_REQUIRE_EQUAL(from_range.size(), 2u);
    BOOST_CHECK_EQUAL(from_range.front(), "sample::Mailer");
}

BOOST_AUTO_TEST_CASE(test_generator_is_consumed_once) {
    int pulls = 0;
    auto known = KnownClasses::from_generator(
        CountingGenerator{{"sample::Transport", "sample::Counter"}, &pulls});

    BOOST_CHECK_EQUAL(pulls, 0);

    const std::vector<std::string> expected{"sample::Transport",
                                            "sample::Counter"};
    BOOST_CHECK(collect(known) == expected);
    BOOST_CHECK_EQUAL(pulls, 3);

    // Replayed from memory, through a copy as well
    KnownClasses copy = known;
    BOOST_CHECK(collect(copy) == expected);
    BOOST_CHECK(collect(known) == expected);
    BOOST_CHECK_EQUAL(pulls, 3);
}

BOOST_AUTO_TEST_SUITE_END()

// =====================================
// Adding known classes to definitions
// =====================================

BOOST_AUTO_TEST_SUITE(add_known_classes_suite)

BOOST_AUTO_TEST_CASE(test_adds_autowired_entries) {
    auto types = make_sample_registry();
    DefinitionMap definitions;

    size_t added = add_known_classes(
        definitions,
        KnownClasses::from_list({"sample::Transport", "sample::Mailer"}),
        *types);

    BOOST_CHECK_EQUAL(added, 2u);
    BOOST_REQUIRE_EQUAL(definitions.count("sample::Mailer"), 1u);
    const auto& mailer = definitions.at("sample::Mailer");
    BOOST_REQUIRE(mailer.kind() == Definition::Kind::CLASS);
    BOOST_CHECK(mailer.as_class().autowired);
}

BOOST_AUTO_TEST_CASE(test_existing_entries_are_kept) {
    auto types = make_sample_registry();
    DefinitionMap definitions{{"sample::Transport", "kept"}};

    size_t added = add_known_classes(
        definitions, KnownClasses::from_list({"sample::Transport"}), *types);

    BOOST_CHECK_EQUAL(added, 0u);
    BOOST_CHECK(definitions.at("sample::Transport").kind() ==
                Definition::Kind::VALUE);
}

BOOST_AUTO_TEST_CASE(test_unknown_and_abstract_types_are_skipped) {
    auto types = make_sample_registry();
    DefinitionMap definitions;

    size_t added = add_known_classes(
        definitions,
        KnownClasses::from_list(
            {"app::Unknown", "sample::Abstract", "sample::Counter"}),
        *types);

    BOOST_CHECK_EQUAL(added, 1u);
    BOOST_CHECK_EQUAL(definitions.size(), 1u);
    BOOST_CHECK_EQUAL(definitions.count("sample::Counter"), 1u);
}

BOOST_AUTO_TEST_SUITE_END()
