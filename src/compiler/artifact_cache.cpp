#include "kiln/compiler/artifact_cache.hpp"

#include <cctype>
#include <fstream>
#include <random>
#include <sstream>
#include <system_error>

#include "kiln/log/logger.hpp"

namespace kiln::compiler {

namespace fs = std::filesystem;

namespace {

bool is_identifier(const std::string& segment) {
    if (segment.empty()) {
        return false;
    }
    unsigned char first = static_cast<unsigned char>(segment.front());
    if (!std::isalpha(first) && first != '_') {
        return false;
    }
    for (char c : segment) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (!std::isalnum(uc) && uc != '_') {
            return false;
        }
    }
    return true;
}

// Random hex suffix keeping concurrent writers' temporary files apart
std::string unique_suffix() {
    std::random_device device;
    std::mt19937_64 generator(device());
    std::ostringstream suffix;
    suffix << std::hex << generator() << generator();
    return suffix.str();
}

}  // namespace

fs::path ArtifactIdentity::file_path() const {
    std::string file_name;
    size_t start = 0;
    while (true) {
        size_t separator = name.find("::", start);
        file_name += name.substr(start, separator - start);
        if (separator == std::string::npos) {
            break;
        }
        file_name += '.';
        start = separator + 2;
    }
    return directory / (file_name + ".kiln");
}

bool ArtifactCache::is_valid_name(const std::string& name) {
    size_t start = 0;
    while (true) {
        size_t separator = name.find("::", start);
        if (!is_identifier(name.substr(start, separator - start))) {
            return false;
        }
        if (separator == std::string::npos) {
            return true;
        }
        start = separator + 2;
    }
}

void ArtifactCache::validate_name(const std::string& name) {
    if (!is_valid_name(name)) {
        throw InvalidArtifactNameError(name);
    }
}

Artifact ArtifactCache::obtain_artifact(const ArtifactIdentity& identity,
                                        const BuildFunction& build) const {
    validate_name(identity.name);

    Artifact artifact{identity, identity.file_path(), {}, false};
    std::error_code ec;
    if (fs::exists(artifact.path, ec)) {
        KILN_LOG_INFO << "Reusing compiled container " << identity.name
                      << " from " << artifact.path.string();
        artifact.source = read_file(artifact.path);
        return artifact;
    }

    std::string source = build();
    // A file that cannot be read back would break this identity for good
    check_program(ArtifactReader::parse(source, artifact.path.string()),
                  identity, artifact.path);
    write_atomically(artifact.path, source);
    KILN_LOG_INFO << "Compiled container " << identity.name << " to "
                  << artifact.path.string();

    // Another process may have renamed its own artifact over ours; the file
    // on disk is the one every later build reads
    artifact.source = read_file(artifact.path);
    artifact.built = true;
    return artifact;
}

std::shared_ptr<const ArtifactProgram> ArtifactCache::obtain_program(
    const ArtifactIdentity& identity, const BuildFunction& build) {
    validate_name(identity.name);
    const std::string key = identity.file_path().lexically_normal().string();

    std::lock_guard<std::mutex> lock(mutex_);
    if (auto it = programs_.find(key); it != programs_.end()) {
        KILN_LOG_DEBUG << "Compiled container " << identity.name
                       << " already loaded from " << key;
        return it->second;
    }

    Artifact artifact = obtain_artifact(identity, build);
    auto program = std::make_shared<const ArtifactProgram>(
        ArtifactReader::parse(artifact.source, artifact.path.string()));
    check_program(*program, identity, artifact.path);

    programs_.emplace(key, program);
    return program;
}

void ArtifactCache::check_program(const ArtifactProgram& program,
                                  const ArtifactIdentity& identity,
                                  const fs::path& path) {
    if (program.container_name != identity.name) {
        throw ArtifactError("Artifact " + path.string() +
                            " declares container " + program.container_name +
                            " instead of " + identity.name);
    }
}

size_t ArtifactCache::cached_programs() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return programs_.size();
}

std::string ArtifactCache::read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        throw ArtifactError("Could not open artifact " + path.string());
    }
    std::ostringstream content;
    content << in.rdbuf();
    if (in.bad()) {
        throw ArtifactError("Could not read artifact " + path.string());
    }
    return content.str();
}

void ArtifactCache::write_atomically(const fs::path& path,
                                     const std::string& source) {
    try {
        fs::create_directories(path.parent_path());
    } catch (const fs::filesystem_error& e) {
        throw ArtifactError("Failed to create directory " +
                            path.parent_path().string() + ": " + e.what());
    }

    const fs::path temp_path =
        path.parent_path() /
        ("." + path.filename().string() + "." + unique_suffix() + ".tmp");

    std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw ArtifactError("Could not open temporary file " +
                            temp_path.string() + " for writing");
    }
    out << source;
    out.close();

    std::error_code ec;
    if (!out) {
        fs::remove(temp_path, ec);
        throw ArtifactError("Failed to write temporary file " +
                            temp_path.string());
    }

    try {
        fs::rename(temp_path, path);
    } catch (const fs::filesystem_error& e) {
        fs::remove(temp_path, ec);
        throw ArtifactError("Failed to rename temporary file " +
                            temp_path.string() + " to " + path.string() +
                            ": " + e.what());
    }
}

}  // namespace kiln::compiler
