#include <skein/package.hpp>
#include <skein/toml_file.hpp>
#include <optional>

namespace skein {

namespace fs = std::filesystem;

static SkeinError malformed(const fs::path& file, const std::string& msg) {
    return SkeinError{SkeinError::MalformedMetadata, msg,
        "the registry holding " + file.parent_path().string() + " is corrupt",
        file.string(), 0};
}

static Result<toml::table> load_metadata_file(const fs::path& file) {
    std::error_code ec;
    if (!fs::is_regular_file(file, ec)) {
        return malformed(file, "missing package metadata file " +
                               file.filename().string());
    }
    return load_toml_file(file, SkeinError::MalformedMetadata);
}

// Each metadata file is a table of version -> subtable
template<typename F>
static Status for_each_version(const toml::table& doc, const fs::path& file, F&& fn) {
    for (const auto& [key, val] : doc) {
        std::string key_str(key.str());
        auto ver = Version::parse(key_str);
        if (ver.is_err()) {
            return malformed(file, "invalid version key '" + key_str + "'");
        }
        auto tbl = val.as_table();
        if (!tbl) {
            return malformed(file, "entry for version " + key_str +
                                   " must be a table");
        }
        SKEIN_TRY(fn(ver.value(), *tbl));
    }
    return ok_status();
}

Result<PackageInfo> load_package_info(const fs::path& dir) {
    fs::path file = dir / "package.toml";
    auto doc = load_metadata_file(file);
    if (doc.is_err()) return std::move(doc).error();

    PackageInfo info;
    info.name = toml_string(doc.value(), "name").value_or("");
    info.uuid = toml_string(doc.value(), "uuid").value_or("");
    info.repo = toml_string(doc.value(), "repo").value_or("");
    return Result<PackageInfo>::ok(std::move(info));
}

Result<VersionHashes> load_versions(const fs::path& dir) {
    fs::path file = dir / "versions.toml";
    auto doc = load_metadata_file(file);
    if (doc.is_err()) return std::move(doc).error();

    VersionHashes out;
    auto st = for_each_version(doc.value(), file,
        [&](const Version& v, const toml::table& tbl) -> Status {
            auto hash = toml_string(tbl, "hash-sha1");
            if (!hash || hash->empty()) {
                return malformed(file, "version " + v.to_string() +
                                       " has no hash-sha1");
            }
            out.emplace(v, *hash);
            return ok_status();
        });
    if (st.is_err()) return std::move(st).error();
    return Result<VersionHashes>::ok(std::move(out));
}

Result<Requirements> load_requirements(const fs::path& dir) {
    fs::path file = dir / "requirements.toml";
    auto doc = load_metadata_file(file);
    if (doc.is_err()) return std::move(doc).error();

    Requirements out;
    auto st = for_each_version(doc.value(), file,
        [&](const Version& v, const toml::table& tbl) -> Status {
            auto& deps = out[v];
            for (const auto& [key, val] : tbl) {
                std::string dep(key.str());
                std::optional<Uuid> uuid;
                if (auto s = val.value<std::string>()) {
                    auto parsed = Uuid::from_string(std::string(*s));
                    if (parsed.is_ok()) uuid = parsed.value();
                }
                if (!uuid) {
                    return malformed(file, "version " + v.to_string() +
                        ": dependency '" + dep + "' must map to a uuid");
                }
                deps.emplace(dep, *uuid);
            }
            return ok_status();
        });
    if (st.is_err()) return std::move(st).error();
    return Result<Requirements>::ok(std::move(out));
}

Result<Compatibility> load_compatibility(const fs::path& dir) {
    fs::path file = dir / "compatibility.toml";
    std::error_code ec;
    if (!fs::exists(file, ec)) {
        return Result<Compatibility>::ok(Compatibility{});
    }
    auto doc = load_metadata_file(file);
    if (doc.is_err()) return std::move(doc).error();

    Compatibility out;
    auto st = for_each_version(doc.value(), file,
        [&](const Version& v, const toml::table& tbl) -> Status {
            auto& compat = out[v];
            for (const auto& [key, val] : tbl) {
                std::string dep(key.str());
                auto s = val.value<std::string>();
                if (!s) {
                    return malformed(file, "version " + v.to_string() +
                        ": compatibility for '" + dep + "' must be a string");
                }
                compat.emplace(dep, std::string(*s));
            }
            return ok_status();
        });
    if (st.is_err()) return std::move(st).error();
    return Result<Compatibility>::ok(std::move(out));
}

Result<PackageMetadata> PackageMetadata::load(const fs::path& dir) {
    PackageMetadata md;
    md.dir = dir;

    auto versions = load_versions(dir);
    if (versions.is_err()) return std::move(versions).error();
    md.versions = std::move(versions).value();

    auto reqs = load_requirements(dir);
    if (reqs.is_err()) return std::move(reqs).error();
    md.requirements = std::move(reqs).value();

    auto compat = load_compatibility(dir);
    if (compat.is_err()) return std::move(compat).error();
    md.compatibility = std::move(compat).value();

    return Result<PackageMetadata>::ok(std::move(md));
}

} // namespace skein
