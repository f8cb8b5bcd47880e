#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "kiln/di/exceptions.hpp"

namespace kiln::compiler {

using di::ErrorKind;

/**
 * @brief One step of the trail from an entry to a nested definition
 */
struct PathSegment {
    enum class Kind {
        ENTRY,
        ARRAY_KEY,
        ARRAY_INDEX,
        CONSTRUCTOR_PARAMETER,
        PROPERTY,
        METHOD_ARGUMENT,
        ENVIRONMENT_DEFAULT
    };

    Kind kind;
    std::string label;

    std::string display() const;
};

/**
 * @brief Ordered trail of segments, rendered only when reported
 */
class CompilationPath {
public:
    CompilationPath() = default;
    explicit CompilationPath(std::string entry_id);

    CompilationPath extended(PathSegment::Kind kind, std::string label) const;

    bool empty() const { return segments_.empty(); }
    size_t size() const { return segments_.size(); }
    const std::vector<PathSegment>& segments() const { return segments_; }
    const std::string& root() const;

    // "foo -> bar -> baz -> index 0"
    std::string render() const;

private:
    std::vector<PathSegment> segments_;
};

/**
 * @brief A definition that cannot be turned into generated code
 *
 * A failure on the entry itself keeps its concrete kind. A failure inside a
 * nested definition reports NestedCompilationFailure and keeps the concrete
 * cause as innermost_kind().
 */
class CompilationError : public di::ContainerError {
public:
    CompilationError(ErrorKind cause_kind, CompilationPath path,
                     std::string cause);

    ErrorKind innermost_kind() const noexcept { return innermost_kind_; }
    const CompilationPath& path() const noexcept { return path_; }
    const std::string& cause() const noexcept { return cause_; }
    const std::string& entry_id() const { return path_.root(); }

private:
    ErrorKind innermost_kind_;
    CompilationPath path_;
    std::string cause_;
};

/**
 * @brief The compiled container name is not a valid artifact identifier
 */
class InvalidArtifactNameError : public di::ContainerError {
public:
    explicit InvalidArtifactNameError(const std::string& name);
};

/**
 * @brief An artifact could not be written, read, parsed or instantiated
 */
class ArtifactError : public di::ContainerError {
public:
    explicit ArtifactError(const std::string& message)
        : di::ContainerError(ErrorKind::ArtifactCorrupt, message) {}
};

}  // namespace kiln::compiler
