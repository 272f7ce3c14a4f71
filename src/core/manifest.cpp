#include <skein/manifest.hpp>
#include <skein/toml_file.hpp>
#include <filesystem>

namespace skein {

static Result<Uuid> parse_identity(const std::string& value,
                                   const std::string& what,
                                   const std::string& origin) {
    auto u = Uuid::from_string(value);
    if (u.is_err()) {
        return SkeinError{SkeinError::Manifest,
            what + " has an invalid uuid '" + value + "'",
            "", origin, 0};
    }
    return u;
}

static Result<ManifestEntry> parse_entry(const std::string& name,
                                         const toml::table& tbl,
                                         const std::string& origin) {
    ManifestEntry entry;
    entry.name = name;

    auto uuid_str = toml_string(tbl, "uuid");
    if (!uuid_str) {
        return SkeinError{SkeinError::Manifest,
            "installed package '" + name + "' has no uuid",
            "", origin, 0};
    }
    auto uuid = parse_identity(*uuid_str, "installed package '" + name + "'", origin);
    if (uuid.is_err()) return std::move(uuid).error();
    entry.uuid = uuid.value();

    if (auto v = toml_string(tbl, "version")) {
        auto ver = Version::parse(*v);
        if (ver.is_err()) {
            return SkeinError{SkeinError::Manifest,
                "installed package '" + name + "': " + ver.error().message,
                "", origin, 0};
        }
        entry.version = std::move(ver).value();
    }

    if (auto h = toml_string(tbl, "hash-sha1")) {
        entry.hash = *h;
    }

    if (auto deps = tbl["deps"].as_table()) {
        for (const auto& [key, val] : *deps) {
            std::string dep_name(key.str());
            auto s = val.value<std::string>();
            if (!s) {
                return SkeinError{SkeinError::Manifest,
                    "dependency '" + dep_name + "' of '" + name +
                    "' must be a uuid string",
                    "", origin, 0};
            }
            auto dep_uuid = parse_identity(std::string(*s),
                "dependency '" + dep_name + "' of '" + name + "'", origin);
            if (dep_uuid.is_err()) return std::move(dep_uuid).error();
            entry.deps.emplace(dep_name, dep_uuid.value());
        }
    }

    return Result<ManifestEntry>::ok(std::move(entry));
}

static Result<Manifest> manifest_from_table(const toml::table& doc,
                                            const std::string& origin) {
    Manifest m;
    for (const auto& [key, val] : doc) {
        std::string name(key.str());
        auto tbl = val.as_table();
        if (!tbl) {
            return SkeinError{SkeinError::Manifest,
                "manifest entry '" + name + "' must be a table",
                "", origin, 0};
        }
        auto entry = parse_entry(name, *tbl, origin);
        if (entry.is_err()) return std::move(entry).error();
        m.packages.emplace(name, std::move(entry).value());
    }
    return Result<Manifest>::ok(std::move(m));
}

Result<Manifest> Manifest::parse(const std::string& toml_str,
                                 const std::string& origin) {
    auto doc = parse_toml(toml_str, origin, SkeinError::Manifest);
    if (doc.is_err()) return std::move(doc).error();
    return manifest_from_table(doc.value(), origin);
}

Result<Manifest> Manifest::load(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return Result<Manifest>::ok(Manifest{});
    }

    auto doc = load_toml_file(path, SkeinError::Manifest);
    if (doc.is_err()) return std::move(doc).error();
    return manifest_from_table(doc.value(), path);
}

const ManifestEntry* Manifest::find(const std::string& name) const {
    auto it = packages.find(name);
    return it == packages.end() ? nullptr : &it->second;
}

std::map<std::string, Uuid> Manifest::identities() const {
    std::map<std::string, Uuid> out;
    for (const auto& [name, entry] : packages) {
        out.emplace(name, entry.uuid);
    }
    return out;
}

} // namespace skein
