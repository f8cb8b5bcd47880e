#include "kiln/di/exceptions.hpp"

namespace kiln::di {

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::ObjectNotCompilable:
            return "ObjectNotCompilable";
        case ErrorKind::AnonymousTypeNotCompilable:
            return "AnonymousTypeNotCompilable";
        case ErrorKind::NestedCompilationFailure:
            return "NestedCompilationFailure";
        case ErrorKind::UnresolvableDefinition:
            return "UnresolvableDefinition";
        case ErrorKind::InvalidArtifactName:
            return "InvalidArtifactName";
        case ErrorKind::ArtifactCorrupt:
            return "ArtifactCorrupt";
        case ErrorKind::CompiledContainerImmutable:
            return "CompiledContainerImmutable";
        case ErrorKind::NotFound:
            return "NotFound";
        case ErrorKind::DependencyFailure:
            return "DependencyFailure";
    }
    return "Unknown";
}

NotFoundError::NotFoundError(const std::string& id)
    : ContainerError(ErrorKind::NotFound,
                     "No entry or class found for '" + id + "'"),
      id_(id) {}

ContainerImmutableError::ContainerImmutableError()
    : ContainerError(
          ErrorKind::CompiledContainerImmutable,
          "You cannot set a definition at runtime on a compiled container. "
          "You can either put your definitions in a file, disable "
          "compilation or set a raw value directly instead of a "
          "definition.") {}

}  // namespace kiln::di
