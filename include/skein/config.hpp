#pragma once

#include <skein/result.hpp>
#include <skein/log.hpp>
#include <optional>
#include <string>
#include <vector>

namespace skein {

// Layered configuration: global < local. Later layers override only the
// fields they set explicitly.
//
//   depots = ["/home/me/.skein", "/opt/skein"]
//   environment = "default"
//   manifest = "/path/to/Manifest.toml"
//
//   [log]
//   level = "debug"
//   color = false
struct Config {
    std::vector<std::string> depots;
    std::string environment = "default";
    std::string manifest;             // explicit manifest path, empty = derived
    std::optional<log::Level> log_level;
    std::optional<bool> log_color;

    bool depots_set = false;
    bool environment_set = false;

    static Result<Config> parse(const std::string& toml_str);
    static Result<Config> load(const std::string& path);

    // Merge another config on top (other's explicit values win)
    void merge(const Config& other);

    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& local);

    // Explicit manifest path, else <first depot>/environments/<env>/Manifest.toml
    std::string manifest_path() const;

    // Push the [log] settings into skein::log
    void apply_logging() const;
};

// $HOME/.skein/config.toml, empty if HOME is unset
std::string global_config_path();

// $HOME/.skein, empty if HOME is unset
std::string default_depot();

} // namespace skein
