#include <skein/registry.hpp>
#include <skein/log.hpp>
#include <skein/toml_file.hpp>

#include <algorithm>
#include <cctype>
#include <fstream>

namespace skein {

namespace fs = std::filesystem;

static const char* const kDescriptorFile = "registry.toml";
static const char* const kListingFile = "packages.toml";

// ---------------------------------------------------------------------------
// String helpers
// ---------------------------------------------------------------------------

static void append_utf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

Result<std::string> unescape_toml_string(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] != '\\') {
            out += s[i];
            continue;
        }
        if (++i >= s.size()) {
            return SkeinError{SkeinError::Parse, "dangling '\\' in string"};
        }
        switch (s[i]) {
        case '"':  out += '"'; break;
        case '\\': out += '\\'; break;
        case 'b':  out += '\b'; break;
        case 'f':  out += '\f'; break;
        case 'n':  out += '\n'; break;
        case 'r':  out += '\r'; break;
        case 't':  out += '\t'; break;
        case 'u':
        case 'U': {
            size_t digits = s[i] == 'u' ? 4 : 8;
            if (i + digits >= s.size()) {
                return SkeinError{SkeinError::Parse,
                    "truncated unicode escape in string"};
            }
            uint32_t cp = 0;
            for (size_t k = 1; k <= digits; ++k) {
                char c = s[i + k];
                cp <<= 4;
                if (c >= '0' && c <= '9') cp |= static_cast<uint32_t>(c - '0');
                else if (c >= 'a' && c <= 'f') cp |= static_cast<uint32_t>(c - 'a' + 10);
                else if (c >= 'A' && c <= 'F') cp |= static_cast<uint32_t>(c - 'A' + 10);
                else {
                    return SkeinError{SkeinError::Parse,
                        "invalid unicode escape in string"};
                }
            }
            if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
                return SkeinError{SkeinError::Parse,
                    "unicode escape is not a scalar value"};
            }
            append_utf8(out, cp);
            i += digits;
            break;
        }
        default:
            return SkeinError{SkeinError::Parse,
                std::string("unknown escape '\\") + s[i] + "' in string"};
        }
    }
    return Result<std::string>::ok(std::move(out));
}

// ---------------------------------------------------------------------------
// Listing record grammar
// ---------------------------------------------------------------------------

namespace {

class LineCursor {
public:
    explicit LineCursor(const std::string& line) : line_(line) {}

    void skip_space() {
        while (pos_ < line_.size() && (line_[pos_] == ' ' || line_[pos_] == '\t'))
            ++pos_;
    }

    bool at_end() const { return pos_ >= line_.size(); }

    bool eat(char c) {
        skip_space();
        if (pos_ < line_.size() && line_[pos_] == c) {
            ++pos_;
            return true;
        }
        return false;
    }

    bool eat_word(const char* word) {
        skip_space();
        size_t n = std::char_traits<char>::length(word);
        if (line_.compare(pos_, n, word) != 0) return false;
        pos_ += n;
        return true;
    }

    // Raw (still escaped) contents of a "..." string
    std::optional<std::string> quoted() {
        skip_space();
        if (pos_ >= line_.size() || line_[pos_] != '"') return std::nullopt;
        size_t start = ++pos_;
        while (pos_ < line_.size() && line_[pos_] != '"') {
            if (line_[pos_] == '\\') ++pos_;
            ++pos_;
        }
        if (pos_ >= line_.size()) return std::nullopt;
        return line_.substr(start, pos_++ - start);
    }

    std::string take(size_t n) {
        skip_space();
        std::string out = line_.substr(pos_, n);
        pos_ += out.size();
        return out;
    }

private:
    const std::string& line_;
    size_t pos_ = 0;
};

bool is_ident_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-';
}

} // namespace

Result<ListingRecord> parse_listing_line(const std::string& line) {
    auto malformed = [&]() {
        return SkeinError{SkeinError::Parse,
            "malformed package listing record", line};
    };

    LineCursor cur(line);
    std::string uuid_str = cur.take(36);
    if (!Uuid::is_canonical(uuid_str)) return malformed();

    if (!cur.eat('=') || !cur.eat('{')) return malformed();

    if (!cur.eat_word("name") || !cur.eat('=')) return malformed();
    auto raw_name = cur.quoted();
    if (!raw_name || !cur.eat(',')) return malformed();

    if (!cur.eat_word("path") || !cur.eat('=')) return malformed();
    auto raw_path = cur.quoted();
    if (!raw_path) return malformed();

    cur.eat(',');
    if (!cur.eat('}')) return malformed();
    cur.skip_space();
    if (!cur.at_end()) return malformed();

    auto name = unescape_toml_string(*raw_name);
    if (name.is_err()) return malformed();
    auto path = unescape_toml_string(*raw_path);
    if (path.is_err()) return malformed();

    ListingRecord rec;
    rec.uuid = Uuid::from_string(uuid_str).value();
    rec.name = std::move(name).value();
    rec.path = std::move(path).value();
    return Result<ListingRecord>::ok(std::move(rec));
}

std::optional<std::string> listing_line_name(const std::string& line) {
    size_t pos = 0;
    while ((pos = line.find("name", pos)) != std::string::npos) {
        size_t at = pos;
        pos += 4;
        if (at > 0 && is_ident_char(line[at - 1])) continue;
        if (pos < line.size() && is_ident_char(line[pos])) continue;

        std::string rest = line.substr(pos);
        LineCursor cur(rest);
        if (!cur.eat('=')) continue;
        auto raw = cur.quoted();
        if (!raw) continue;
        auto name = unescape_toml_string(*raw);
        if (name.is_err()) return *raw;
        return std::move(name).value();
    }
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// RegistryIndexBuilder
// ---------------------------------------------------------------------------

RegistryIndexBuilder::RegistryIndexBuilder(std::vector<fs::path> registries)
    : registries_(std::move(registries)) {}

Result<std::vector<fs::path>>
RegistryIndexBuilder::registries_in_depot(const fs::path& depot) {
    std::vector<fs::path> found;
    fs::path dir = depot / "registries";

    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        log::debug("depot '%s' has no registries directory", depot.string().c_str());
        return Result<std::vector<fs::path>>::ok(std::move(found));
    }

    fs::directory_iterator it(dir, ec);
    if (ec) {
        return SkeinError{SkeinError::IO,
            "cannot list registries in '" + dir.string() + "': " + ec.message()};
    }
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        const fs::path& reg = it->path();
        std::error_code entry_ec;
        if (fs::is_regular_file(reg / kDescriptorFile, entry_ec) &&
            fs::is_regular_file(reg / kListingFile, entry_ec))
        {
            found.push_back(fs::absolute(reg, entry_ec).lexically_normal());
        } else {
            log::trace("skipping '%s': not a registry", reg.string().c_str());
        }
    }
    if (ec) {
        return SkeinError{SkeinError::IO,
            "cannot list registries in '" + dir.string() + "': " + ec.message()};
    }

    std::sort(found.begin(), found.end());
    return Result<std::vector<fs::path>>::ok(std::move(found));
}

Result<RegistryIndexBuilder>
RegistryIndexBuilder::discover(const std::vector<std::string>& depots) {
    std::vector<fs::path> all;
    std::vector<RegistryInfo> infos;
    for (const auto& depot : depots) {
        auto regs = registries_in_depot(depot);
        if (regs.is_err()) return std::move(regs).error();
        for (auto& r : regs.value()) {
            auto info = load_info(r);
            if (info.is_err()) return std::move(info).error();
            log::debug("found registry %s (%s) at %s",
                       info.value().name.c_str(),
                       info.value().repo.empty() ? "no repo" : info.value().repo.c_str(),
                       r.string().c_str());
            infos.push_back(std::move(info).value());
            all.push_back(std::move(r));
        }
    }
    RegistryIndexBuilder builder(std::move(all));
    builder.infos_ = std::move(infos);
    return Result<RegistryIndexBuilder>::ok(std::move(builder));
}

Result<RegistryInfo> RegistryIndexBuilder::load_info(const fs::path& registry) {
    fs::path file = registry / kDescriptorFile;
    auto doc = load_toml_file(file, SkeinError::MalformedMetadata);
    if (doc.is_err()) return std::move(doc).error();

    const toml::table& tbl = doc.value();
    RegistryInfo info;
    info.root = registry;
    info.name = toml_string(tbl, "name").value_or(registry.filename().string());
    info.uuid = toml_string(tbl, "uuid").value_or("");
    info.repo = toml_string(tbl, "repo").value_or("");
    info.description = toml_string(tbl, "description").value_or("");

    if (!info.uuid.empty() && Uuid::from_string(info.uuid).is_err()) {
        return SkeinError{SkeinError::MalformedMetadata,
            "registry '" + info.name + "' has an invalid uuid '" + info.uuid + "'",
            "", file.string(), 0};
    }
    return Result<RegistryInfo>::ok(std::move(info));
}

Status RegistryIndexBuilder::scan_listing(const fs::path& registry,
                                          const std::set<std::string>& names,
                                          RegistryIndex& index) const {
    fs::path file = registry / kListingFile;
    std::ifstream in(file);
    if (!in.is_open()) {
        return SkeinError{SkeinError::IO, "cannot open " + file.string()};
    }

    // name -> identity for this registry alone
    std::map<std::string, Uuid> seen;

    std::string line;
    int lineno = 0;
    while (std::getline(in, line)) {
        ++lineno;
        if (!line.empty() && line.back() == '\r') line.pop_back();

        size_t first = line.find_first_not_of(" \t");
        if (first == std::string::npos || line[first] == '#' || line[first] == '[')
            continue;

        auto quick = listing_line_name(line);
        if (!quick || !names.count(*quick)) continue;

        auto rec = parse_listing_line(line);
        if (rec.is_err()) {
            return SkeinError{SkeinError::MalformedMetadata,
                "malformed packages.toml record: " + line,
                "the registry at " + registry.string() + " is corrupt; "
                "refresh or remove it",
                file.string(), lineno};
        }
        ListingRecord& r = rec.value();

        auto prev = seen.find(r.name);
        if (prev != seen.end() && prev->second != r.uuid) {
            return SkeinError{SkeinError::MalformedMetadata,
                "registry lists '" + r.name + "' under two identities: " +
                prev->second.to_string() + " and " + r.uuid.to_string(),
                "", file.string(), lineno};
        }
        seen.emplace(r.name, r.uuid);

        std::error_code ec;
        fs::path abs = fs::absolute(registry / r.path, ec).lexically_normal();
        if (ec) abs = (registry / r.path).lexically_normal();

        auto& paths = index[r.name][r.uuid];
        if (std::find(paths.begin(), paths.end(), abs.string()) == paths.end()) {
            paths.push_back(abs.string());
        }
    }

    if (in.bad()) {
        return SkeinError{SkeinError::IO, "error reading " + file.string()};
    }
    return ok_status();
}

Result<RegistryIndex>
RegistryIndexBuilder::find_registered(const std::set<std::string>& names) const {
    RegistryIndex index;
    if (names.empty()) return Result<RegistryIndex>::ok(std::move(index));

    for (const auto& registry : registries_) {
        SKEIN_TRY(scan_listing(registry, names, index));
    }
    return Result<RegistryIndex>::ok(std::move(index));
}

} // namespace skein
