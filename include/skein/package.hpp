#pragma once

#include <skein/result.hpp>
#include <skein/uuid.hpp>
#include <skein/version.hpp>
#include <filesystem>
#include <map>
#include <string>

namespace skein {

// package.toml
struct PackageInfo {
    std::string name;
    std::string uuid;
    std::string repo;
};

// versions.toml: version -> content hash ("hash-sha1")
using VersionHashes = std::map<Version, std::string>;

// requirements.toml: version -> dependency name -> dependency identity
using Requirements = std::map<Version, std::map<std::string, Uuid>>;

// compatibility.toml: version -> dependency name -> spec text, uninterpreted
using Compatibility = std::map<Version, std::map<std::string, std::string>>;

// Everything one registry says about one package
struct PackageMetadata {
    std::filesystem::path dir;
    VersionHashes versions;
    Requirements requirements;
    Compatibility compatibility;

    // versions.toml and requirements.toml are required, compatibility.toml
    // is optional. Every problem is MalformedMetadata.
    static Result<PackageMetadata> load(const std::filesystem::path& dir);
};

Result<PackageInfo> load_package_info(const std::filesystem::path& dir);
Result<VersionHashes> load_versions(const std::filesystem::path& dir);
Result<Requirements> load_requirements(const std::filesystem::path& dir);
Result<Compatibility> load_compatibility(const std::filesystem::path& dir);

} // namespace skein
