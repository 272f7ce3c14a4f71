#pragma once

#include <skein/result.hpp>
#include <toml++/toml.hpp>
#include <filesystem>
#include <optional>
#include <string>

namespace skein {

// Parse a TOML document. Syntax errors are reported with `code` so callers
// can tell a corrupt registry file from a broken user config.
Result<toml::table> parse_toml(const std::string& text,
                               const std::string& origin,
                               SkeinError::Code code);

// Read the whole file, close it, then parse. A missing or unreadable file
// is an IO error.
Result<toml::table> load_toml_file(const std::filesystem::path& path,
                                   SkeinError::Code code);

// String value of `key`, or nullopt when absent or not a string
std::optional<std::string> toml_string(const toml::table& tbl,
                                       const std::string& key);

} // namespace skein
