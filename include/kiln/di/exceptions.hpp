#pragma once

#include <stdexcept>
#include <string>

namespace kiln::di {

/**
 * @brief Category of every error raised by the container and its compiler
 */
enum class ErrorKind {
    ObjectNotCompilable,
    AnonymousTypeNotCompilable,
    NestedCompilationFailure,
    UnresolvableDefinition,
    InvalidArtifactName,
    ArtifactCorrupt,
    CompiledContainerImmutable,
    NotFound,
    DependencyFailure
};

const char* to_string(ErrorKind kind);

/**
 * @brief Base class of all container errors
 */
class ContainerError : public std::runtime_error {
public:
    ContainerError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

/**
 * @brief No definition and no autowirable type exists for an identifier
 */
class NotFoundError : public ContainerError {
public:
    explicit NotFoundError(const std::string& id);

    const std::string& id() const noexcept { return id_; }

private:
    std::string id_;
};

/**
 * @brief An entry exists but could not be resolved (cycle, failing
 * constructor, type mismatch, missing parameter)
 */
class DependencyError : public ContainerError {
public:
    explicit DependencyError(const std::string& message)
        : ContainerError(ErrorKind::DependencyFailure, message) {}
};

/**
 * @brief Mutation attempted on a compiled container
 */
class ContainerImmutableError : public ContainerError {
public:
    ContainerImmutableError();
};

}  // namespace kiln::di
