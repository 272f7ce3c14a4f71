#pragma once

#include <skein/uuid.hpp>
#include <skein/version.hpp>
#include <map>
#include <string>

namespace skein {

// One immutable, content-addressed release as declared by a registry
struct AvailableVersion {
    Version version;
    std::string hash;                                // hash-sha1
    std::map<std::string, Uuid> deps;                // dependency name -> identity
    std::map<std::string, std::string> compat;       // passed through, not interpreted
};

// name -> version -> candidate. Only names reachable from the request and
// only versions that passed the request and identity checks.
struct DependencyGraph {
    std::map<std::string, std::map<Version, AvailableVersion>> packages;

    bool contains(const std::string& name) const;

    // nullptr if the name or version is not a candidate
    const AvailableVersion* find(const std::string& name, const Version& v) const;

    size_t version_count() const;

    // Deterministic TOML rendering; equal graphs give identical text
    std::string to_toml() const;
};

} // namespace skein
