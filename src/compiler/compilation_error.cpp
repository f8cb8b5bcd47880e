#include "kiln/compiler/compilation_error.hpp"

#include <utility>

namespace kiln::compiler {

namespace {

const std::string kUnnamedRoot = "<definition>";

std::string render_message(const CompilationPath& path,
                           const std::string& cause) {
    if (path.size() <= 1) {
        return "Entry \"" + path.root() + "\" cannot be compiled: " + cause;
    }

    std::string message = "Error while compiling " + path.root() + ".";
    for (size_t i = 1; i + 1 < path.size(); ++i) {
        message += " Error while compiling <nested definition>.";
    }
    message += " " + cause + " [" + path.render() + "]";
    return message;
}

}  // namespace

std::string PathSegment::display() const {
    switch (kind) {
        case Kind::ENTRY:
        case Kind::ARRAY_KEY:
            return label;
        case Kind::ARRAY_INDEX:
            return "index " + label;
        case Kind::CONSTRUCTOR_PARAMETER:
            return "parameter '" + label + "'";
        case Kind::PROPERTY:
            return "property '" + label + "'";
        case Kind::METHOD_ARGUMENT:
            return "method " + label;
        case Kind::ENVIRONMENT_DEFAULT:
            return "default of '" + label + "'";
    }
    return label;
}

CompilationPath::CompilationPath(std::string entry_id) {
    segments_.push_back({PathSegment::Kind::ENTRY, std::move(entry_id)});
}

CompilationPath CompilationPath::extended(PathSegment::Kind kind,
                                          std::string label) const {
    CompilationPath copy = *this;
    copy.segments_.push_back({kind, std::move(label)});
    return copy;
}

const std::string& CompilationPath::root() const {
    return segments_.empty() ? kUnnamedRoot : segments_.front().label;
}

std::string CompilationPath::render() const {
    std::string out;
    for (const auto& segment : segments_) {
        if (!out.empty()) {
            out += " -> ";
        }
        out += segment.display();
    }
    return out;
}

CompilationError::CompilationError(ErrorKind cause_kind, CompilationPath path,
                                   std::string cause)
    : di::ContainerError(path.size() > 1
                             ? ErrorKind::NestedCompilationFailure
                             : cause_kind,
                         render_message(path, cause)),
      innermost_kind_(cause_kind),
      path_(std::move(path)),
      cause_(std::move(cause)) {}

InvalidArtifactNameError::InvalidArtifactNameError(const std::string& name)
    : di::ContainerError(ErrorKind::InvalidArtifactName,
                         "The container cannot be compiled: `" + name +
                             "` is not a valid container name") {}

}  // namespace kiln::compiler
