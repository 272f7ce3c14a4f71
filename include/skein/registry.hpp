#pragma once

#include <skein/result.hpp>
#include <skein/uuid.hpp>
#include <filesystem>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace skein {

// identity -> absolute package metadata directories, in registry order
using PackageLocations = std::map<Uuid, std::vector<std::string>>;

// name -> identity -> locations
using RegistryIndex = std::map<std::string, PackageLocations>;

// One line of a registry's packages.toml:
//   <uuid> = { name = "<name>", path = "<relative-path>" }
struct ListingRecord {
    Uuid uuid;
    std::string name;
    std::string path;
};

// Full parse of a listing line; Parse error if it does not match the grammar
Result<ListingRecord> parse_listing_line(const std::string& line);

// Cheap pre-filter: the unescaped value of the first `name = "..."` on the
// line, without validating the rest of the record
std::optional<std::string> listing_line_name(const std::string& line);

// Undo TOML basic-string escapes. Parse error on an unknown escape.
Result<std::string> unescape_toml_string(const std::string& s);

// Contents of a registry's registry.toml
struct RegistryInfo {
    std::filesystem::path root;
    std::string name;
    std::string uuid;
    std::string repo;
    std::string description;
};

class RegistryIndexBuilder {
public:
    explicit RegistryIndexBuilder(std::vector<std::filesystem::path> registries);

    // All registries under each depot's registries/ directory, with their
    // descriptors read. A corrupt descriptor is MalformedMetadata.
    static Result<RegistryIndexBuilder> discover(const std::vector<std::string>& depots);

    // Subdirectories of <depot>/registries holding both registry.toml and
    // packages.toml, sorted. A depot without registries/ yields none.
    static Result<std::vector<std::filesystem::path>>
    registries_in_depot(const std::filesystem::path& depot);

    static Result<RegistryInfo> load_info(const std::filesystem::path& registry);

    const std::vector<std::filesystem::path>& registries() const { return registries_; }

    // Descriptors in registries() order; empty unless built by discover()
    const std::vector<RegistryInfo>& infos() const { return infos_; }

    // Index every listing record whose name is in `names`
    Result<RegistryIndex> find_registered(const std::set<std::string>& names) const;

private:
    Status scan_listing(const std::filesystem::path& registry,
                        const std::set<std::string>& names,
                        RegistryIndex& index) const;

    std::vector<std::filesystem::path> registries_;
    std::vector<RegistryInfo> infos_;
};

} // namespace skein
