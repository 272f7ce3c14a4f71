#pragma once

#include <skein/result.hpp>
#include <skein/uuid.hpp>
#include <skein/version.hpp>
#include <map>
#include <optional>
#include <string>

namespace skein {

// One installed package:
//
//   [Example]
//   uuid = "7876af07-990d-54b4-ab0e-23690620f79a"
//   version = "0.5.1"
//   hash-sha1 = "46e44e869b4d90b96bd8ed1fdcf32244fddfb6cc"
//
//   [Example.deps]
//   Compat = "34da2185-b29b-5c13-b0c7-acf172513d20"
struct ManifestEntry {
    std::string name;
    Uuid uuid;
    std::optional<Version> version;
    std::optional<std::string> hash;
    std::map<std::string, Uuid> deps;
};

// Installed package set of one environment. Never written by the resolver.
struct Manifest {
    std::map<std::string, ManifestEntry> packages;

    static Result<Manifest> parse(const std::string& toml_str,
                                  const std::string& origin = "manifest");

    // A manifest that does not exist yet is an empty environment
    static Result<Manifest> load(const std::string& path);

    // nullptr if the name is not installed
    const ManifestEntry* find(const std::string& name) const;

    // name -> installed identity
    std::map<std::string, Uuid> identities() const;
};

} // namespace skein
