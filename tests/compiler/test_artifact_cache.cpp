// tests/compiler/test_artifact_cache.cpp
#define BOOST_TEST_MODULE artifact_cache_tests
#include <boost/test/unit_test.hpp>
#include <atomic>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "../support/temp_directory.hpp"
#include "kiln/compiler/artifact_cache.hpp"

using namespace kiln::compiler;

namespace {

const std::string kSource =
    "container Cached extends \"kiln::di::CompiledContainer\"\n"
    "routine get1\n"
    "    push.string \"bar\"\n"
    "    ret\n"
    "end\n"
    "dispatch\n"
    "    \"foo\" get1\n"
    "end\n";

struct ArtifactCacheFixture : TempDirectoryFixture {
    ArtifactCache cache;
    int builds = 0;

    ArtifactIdentity identity(const std::string& name = "Cached") const {
        return ArtifactIdentity{directory() / "artifacts", name,
                                "kiln::di::CompiledContainer"};
    }

    ArtifactCache::BuildFunction builder(const std::string& source = kSource) {
        return [this, source] {
            ++builds;
            return source;
        };
    }
};

}  // namespace

BOOST_AUTO_TEST_SUITE(artifact_name_suite)

BOOST_AUTO_TEST_CASE(test_valid_names) {
    BOOST_CHECK(ArtifactCache::is_valid_name("Container"));
    BOOST_CHECK(ArtifactCache::is_valid_name("_Compiled2"));
    BOOST_CHECK(ArtifactCache::is_valid_name("app::di::Container"));
}

BOOST_AUTO_TEST_CASE(test_invalid_names) {
    BOOST_CHECK(!ArtifactCache::is_valid_name(""));
    BOOST_CHECK(!ArtifactCache::is_valid_name("123-abc"));
    BOOST_CHECK(!ArtifactCache::is_valid_name("1Container"));
    BOOST_CHECK(!ArtifactCache::is_valid_name("app::"));
    BOOST_CHECK(!ArtifactCache::is_valid_name("::Container"));
    BOOST_CHECK(!ArtifactCache::is_valid_name("app:Container"));
    BOOST_CHECK(!ArtifactCache::is_valid_name("my container"));
    BOOST_CHECK(!ArtifactCache::is_valid_name("app/../Container"));
}

BOOST_AUTO_TEST_CASE(test_file_path) {
    ArtifactIdentity identity{"/var/cache", "app::di::Container",
                              "kiln::di::CompiledContainer"};
    BOOST_CHECK_EQUAL(identity.file_path().string(),
                      "/var/cache/app.di.Container.kiln");
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(artifact_cache_suite, ArtifactCacheFixture)

BOOST_AUTO_TEST_CASE(test_first_call_builds_and_persists) {
    Artifact artifact = cache.obtain_artifact(identity(), builder());

    BOOST_CHECK(artifact.built);
    BOOST_CHECK_EQUAL(builds, 1);
    BOOST_CHECK_EQUAL(artifact.source, kSource);
    BOOST_CHECK(artifact.path == identity().file_path());
    BOOST_CHECK_EQUAL(read(temp_dir / "artifacts" / "Cached.kiln"), kSource);

    auto files = list(temp_dir / "artifacts");
    BOOST_CHECK_EQUAL(files.size(), 1u);
}

BOOST_AUTO_TEST_CASE(test_existing_artifact_is_read_verbatim) {
    cache.obtain_artifact(identity(), builder());
    Artifact second =
        cache.obtain_artifact(identity(), builder("something else"));

    BOOST_CHECK(!second.built);
    BOOST_CHECK_EQUAL(builds, 1);
    BOOST_CHECK_EQUAL(second.source, kSource);
}

BOOST_AUTO_TEST_CASE(test_hand_placed_artifact_is_used) {
    boost::filesystem::create_directories(temp_dir / "artifacts");
    write(temp_dir / "artifacts" / "Cached.kiln", kSource);

    auto program = cache.obtain_program(identity(), builder("unused"));

    BOOST_CHECK_EQUAL(builds, 0);
    BOOST_REQUIRE(program->find_routine_for("foo") != nullptr);
}

BOOST_AUTO_TEST_CASE(test_invalid_name_touches_nothing) {
    BOOST_CHECK_THROW(cache.obtain_artifact(identity("123-abc"), builder()),
                      InvalidArtifactNameError);
    BOOST_CHECK_THROW(cache.obtain_program(identity("123-abc"), builder()),
                      InvalidArtifactNameError);

    BOOST_CHECK_EQUAL(builds, 0);
    BOOST_CHECK(!boost::filesystem::exists(temp_dir / "artifacts"));
}

BOOST_AUTO_TEST_CASE(test_failed_build_writes_nothing) {
    auto failing = [this]() -> std::string {
        ++builds;
        throw std::runtime_error("analysis failed");
    };

    BOOST_CHECK_THROW(cache.obtain_artifact(identity(), failing),
                      std::runtime_error);
    BOOST_CHECK(list(temp_dir / "artifacts").empty());

    // The next build is not short-circuited by a partial artifact
    Artifact artifact = cache.obtain_artifact(identity(), builder());
    BOOST_CHECK(artifact.built);
    BOOST_CHECK_EQUAL(builds, 2);
}

BOOST_AUTO_TEST_CASE(test_unwritable_directory) {
    // A regular file where the artifact directory should be
    write(temp_dir / "artifacts", "not a directory");

    BOOST_CHECK_THROW(cache.obtain_artifact(identity(), builder()),
                      ArtifactError);
    BOOST_CHECK_EQUAL(list(temp_dir).size(), 1u);
}

BOOST_AUTO_TEST_CASE(test_programs_are_memoized) {
    auto first = cache.obtain_program(identity(), builder());
    auto second = cache.obtain_program(identity(), builder());

    BOOST_CHECK(first == second);
    BOOST_CHECK_EQUAL(builds, 1);
    BOOST_CHECK_EQUAL(cache.cached_programs(), 1u);

    // Another handle parses the persisted artifact again
    ArtifactCache other;
    auto third = other.obtain_program(identity(), builder());
    BOOST_CHECK(first != third);
    BOOST_CHECK_EQUAL(builds, 1);
    BOOST_CHECK(third->find_routine_for("foo") != nullptr);
}

BOOST_AUTO_TEST_CASE(test_corrupt_artifact_on_disk) {
    boost::filesystem::create_directories(temp_dir / "artifacts");
    write(temp_dir / "artifacts" / "Cached.kiln",
          "container Cached extends \"kiln::di::CompiledContainer\"\n"
          "routine get1\n");

    BOOST_CHECK_THROW(cache.obtain_program(identity(), builder()),
                      ArtifactError);
    BOOST_CHECK_EQUAL(builds, 0);
    BOOST_CHECK_EQUAL(cache.cached_programs(), 0u);
}

BOOST_AUTO_TEST_CASE(test_unreadable_build_is_not_persisted) {
    auto truncated = builder("container Cached\n");

    BOOST_CHECK_THROW(cache.obtain_artifact(identity(), truncated),
                      ArtifactError);
    BOOST_CHECK(list(temp_dir / "artifacts").empty());

    // Nothing blocks a later, readable build of the same identity
    Artifact artifact = cache.obtain_artifact(identity(), builder());
    BOOST_CHECK(artifact.built);
    BOOST_CHECK_EQUAL(read(temp_dir / "artifacts" / "Cached.kiln"), kSource);
}

BOOST_AUTO_TEST_CASE(test_container_name_mismatch) {
    BOOST_CHECK_THROW(cache.obtain_program(identity("Other"), builder()),
                      ArtifactError);
    BOOST_CHECK(list(temp_dir / "artifacts").empty());
}

BOOST_AUTO_TEST_CASE(test_concurrent_callers_share_one_program) {
    std::vector<std::thread> threads;
    std::vector<std::shared_ptr<const ArtifactProgram>> programs(4);
    auto build = builder();

    for (size_t i = 0; i < programs.size(); ++i) {
        threads.emplace_back([&, i] {
            programs[i] = cache.obtain_program(identity(), build);
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    BOOST_CHECK_EQUAL(builds, 1);
    for (const auto& program : programs) {
        BOOST_CHECK(program == programs.front());
    }
}

BOOST_AUTO_TEST_CASE(test_independent_first_writers) {
    constexpr size_t kWriters = 8;
    std::atomic<bool> go{false};
    std::atomic<int> built{0};
    std::vector<std::thread> threads;
    std::vector<std::shared_ptr<const ArtifactProgram>> programs(kWriters);

    // Separate caches share no mutex, as separate processes would
    for (size_t i = 0; i < kWriters; ++i) {
        threads.emplace_back([&, i] {
            ArtifactCache own;
            while (!go) {
                std::this_thread::yield();
            }
            programs[i] = own.obtain_program(identity(), [&] {
                ++built;
                return kSource;
            });
        });
    }
    go = true;
    for (auto& thread : threads) {
        thread.join();
    }

    BOOST_CHECK_GE(built.load(), 1);
    for (const auto& program : programs) {
        BOOST_REQUIRE(program != nullptr);
        BOOST_CHECK_EQUAL(program->container_name, "Cached");
        BOOST_CHECK(program->find_routine_for("foo") != nullptr);
    }

    auto files = list(temp_dir / "artifacts");
    BOOST_REQUIRE_EQUAL(files.size(), 1u);
    BOOST_CHECK_EQUAL(files.front(), "Cached.kiln");
    BOOST_CHECK_EQUAL(read(temp_dir / "artifacts" / "Cached.kiln"), kSource);
}

BOOST_AUTO_TEST_SUITE_END()
