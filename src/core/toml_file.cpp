#include <skein/toml_file.hpp>
#include <fstream>
#include <sstream>

namespace skein {

Result<toml::table> parse_toml(const std::string& text,
                               const std::string& origin,
                               SkeinError::Code code) {
    try {
        return Result<toml::table>::ok(toml::parse(text, origin));
    } catch (const toml::parse_error& e) {
        return SkeinError{code,
            "TOML parse error: " + std::string(e.description()),
            "", origin, static_cast<int>(e.source().begin.line)};
    }
}

Result<toml::table> load_toml_file(const std::filesystem::path& path,
                                   SkeinError::Code code) {
    std::string text;
    {
        std::ifstream file(path);
        if (!file.is_open()) {
            return SkeinError{SkeinError::IO,
                "cannot open file: " + path.string()};
        }
        std::ostringstream ss;
        ss << file.rdbuf();
        if (file.bad()) {
            return SkeinError{SkeinError::IO,
                "error reading file: " + path.string()};
        }
        text = ss.str();
    }
    return parse_toml(text, path.string(), code);
}

std::optional<std::string> toml_string(const toml::table& tbl,
                                       const std::string& key) {
    if (auto v = tbl[key].value<std::string>()) {
        return std::string(*v);
    }
    return std::nullopt;
}

} // namespace skein
