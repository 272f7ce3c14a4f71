#include <skein/config.hpp>
#include <skein/toml_file.hpp>
#include <cstdlib>
#include <filesystem>

namespace skein {

namespace fs = std::filesystem;

static Result<Config> config_from_table(const toml::table& doc) {
    Config cfg;

    if (auto node = doc.get("depots")) {
        auto arr = node->as_array();
        if (!arr) {
            return SkeinError{SkeinError::Config,
                "'depots' must be an array of paths"};
        }
        for (const auto& elem : *arr) {
            auto s = elem.value<std::string>();
            if (!s) {
                return SkeinError{SkeinError::Config,
                    "'depots' entries must be strings"};
            }
            cfg.depots.push_back(std::string(*s));
        }
        cfg.depots_set = true;
    }

    if (auto env = toml_string(doc, "environment")) {
        if (env->empty()) {
            return SkeinError{SkeinError::Config,
                "invalid environment name: \"\""};
        }
        cfg.environment = *env;
        cfg.environment_set = true;
    }

    if (auto m = toml_string(doc, "manifest")) {
        cfg.manifest = *m;
    }

    if (auto log_tbl = doc["log"].as_table()) {
        if (auto lvl = toml_string(*log_tbl, "level")) {
            auto parsed_level = log::parse_level(*lvl);
            if (parsed_level.is_err()) return std::move(parsed_level).error();
            cfg.log_level = parsed_level.value();
        }
        if (auto color = (*log_tbl)["color"].value<bool>()) {
            cfg.log_color = *color;
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::parse(const std::string& toml_str) {
    auto parsed = parse_toml(toml_str, "config", SkeinError::Config);
    if (parsed.is_err()) return std::move(parsed).error();
    return config_from_table(parsed.value());
}

Result<Config> Config::load(const std::string& path) {
    auto parsed = load_toml_file(path, SkeinError::Config);
    if (parsed.is_err()) return std::move(parsed).error();

    auto cfg = config_from_table(parsed.value());
    if (cfg.is_err()) {
        auto err = std::move(cfg).error();
        err.file = path;
        return err;
    }
    return cfg;
}

void Config::merge(const Config& other) {
    if (other.depots_set) {
        depots = other.depots;
        depots_set = true;
    }
    if (other.environment_set) {
        environment = other.environment;
        environment_set = true;
    }
    if (!other.manifest.empty()) manifest = other.manifest;
    if (other.log_level) log_level = other.log_level;
    if (other.log_color) log_color = other.log_color;
}

Config Config::effective(const std::optional<Config>& global,
                         const std::optional<Config>& local) {
    Config result;
    std::string depot = default_depot();
    if (!depot.empty()) result.depots.push_back(depot);

    if (global.has_value()) result.merge(global.value());
    if (local.has_value()) result.merge(local.value());
    return result;
}

std::string Config::manifest_path() const {
    if (!manifest.empty()) return manifest;
    std::string depot = depots.empty() ? default_depot() : depots.front();
    if (depot.empty()) return "";
    return (fs::path(depot) / "environments" / environment / "Manifest.toml")
        .string();
}

void Config::apply_logging() const {
    if (log_level) log::set_level(*log_level);
    if (log_color) log::set_color_enabled(*log_color);
}

std::string global_config_path() {
    std::string depot = default_depot();
    if (depot.empty()) return "";
    return depot + "/config.toml";
}

std::string default_depot() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.skein";
}

} // namespace skein
