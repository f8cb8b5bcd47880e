#pragma once

#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "kiln/compiler/artifact_reader.hpp"

namespace kiln::compiler {

/**
 * @brief Where a compiled container lives and what it derives from
 */
struct ArtifactIdentity {
    std::filesystem::path directory;
    std::string name;
    std::string parent_type = "kiln::di::CompiledContainer";

    // directory / "app.Container.kiln" for the name "app::Container"
    std::filesystem::path file_path() const;
};

struct Artifact {
    ArtifactIdentity identity;
    std::filesystem::path path;
    std::string source;
    // True when this call generated and wrote the artifact
    bool built = false;
};

/**
 * @brief Persist-or-reuse store for compiled container artifacts
 *
 * An artifact is written once per identity and never regenerated: when the
 * file exists its content wins, whatever the definitions passed to the
 * current build. Files are written to a unique temporary name in the target
 * directory and renamed into place, so concurrent builders never observe a
 * partial artifact.
 *
 * Parsed programs are memoized per artifact path for the lifetime of the
 * cache object. The memo is guarded by a mutex.
 */
class ArtifactCache {
public:
    using BuildFunction = std::function<std::string()>;

    // True for identifier segments joined by "::"
    static bool is_valid_name(const std::string& name);

    /**
     * @throws InvalidArtifactNameError
     */
    static void validate_name(const std::string& name);

    /**
     * @brief Read the artifact for `identity`, building it first if needed
     * @throws InvalidArtifactNameError before touching the file system
     * @throws ArtifactError on I/O failure, or when a freshly built source
     * cannot be parsed back; nothing is written in that case
     */
    Artifact obtain_artifact(const ArtifactIdentity& identity,
                             const BuildFunction& build) const;

    /**
     * @brief Same as obtain_artifact(), parsed and memoized
     * @throws ArtifactError if the artifact cannot be parsed or declares
     * another container name
     */
    std::shared_ptr<const ArtifactProgram> obtain_program(
        const ArtifactIdentity& identity, const BuildFunction& build);

    size_t cached_programs() const;

private:
    static void check_program(const ArtifactProgram& program,
                              const ArtifactIdentity& identity,
                              const std::filesystem::path& path);
    static std::string read_file(const std::filesystem::path& path);
    static void write_atomically(const std::filesystem::path& path,
                                 const std::string& source);

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<const ArtifactProgram>> programs_;
};

}  // namespace kiln::compiler
