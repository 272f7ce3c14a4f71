#pragma once

#include <skein/result.hpp>
#include <optional>
#include <string>
#include <vector>

namespace skein {

// Full version: major.minor.micro[-label][+build]
//
// label and build are dot-separated identifiers. Ordering follows the
// registry's version type: numeric identifiers compare as numbers and sort
// before alphanumeric ones, a label sorts before the release, and a build
// sorts after the plain version ("1.2.3" < "1.2.3+0").
struct Version {
    int major = 0;
    int minor = 0;
    int micro = 0;
    std::string label;  // e.g., "alpha", "rc.1", empty for release
    std::string build;  // e.g., "0", "linux.x86_64", empty if none

    static Result<Version> parse(const std::string& s);
    std::string to_string() const;

    bool operator==(const Version& o) const;
    bool operator!=(const Version& o) const;
    bool operator<(const Version& o) const;
    bool operator<=(const Version& o) const;
    bool operator>(const Version& o) const;
    bool operator>=(const Version& o) const;
};

// Partial version for constraints: "1", "1.2", "1.2.3"
struct PartialVersion {
    int major = 0;
    int minor = -1;  // -1 means unset
    int micro = -1;  // -1 means unset

    static Result<PartialVersion> parse(const std::string& s);
    std::string to_string() const;
};

enum class ConstraintOp {
    Exact,       // =1.2.3
    Caret,       // ^1.2.3 (compatible with)
    Tilde,       // ~1.2.3 (patch-level changes)
    GreaterEq,   // >=1.2.3
    Greater,     // >1.2.3
    LessEq,      // <=1.2.3
    Less,        // <1.2.3
    Any,         // *
};

struct VersionConstraint {
    ConstraintOp op;
    PartialVersion version;

    bool matches(const Version& v) const;
    std::string to_string() const;
};

// Conjunction of constraints: ">=1.0.0, <2.0.0"
struct VersionReq {
    std::vector<VersionConstraint> constraints;

    static Result<VersionReq> parse(const std::string& s);
    bool matches(const Version& v) const;
    std::string to_string() const;
};

// What a caller asks for: one exact version, or a union of ranges
// ("^1.2 || >=3.0.0, <3.5.0"). A default-constructed spec admits everything.
class VersionSpec {
public:
    VersionSpec() = default;

    static VersionSpec any();
    static VersionSpec exact(Version v);
    static VersionSpec ranges(std::vector<VersionReq> alternatives);

    // "*" or "" -> any; "=1.2.3" -> exact; otherwise ranges split on "||"
    static Result<VersionSpec> parse(const std::string& s);

    bool matches(const Version& v) const;
    bool is_any() const;
    bool is_exact() const { return exact_.has_value(); }
    const std::optional<Version>& exact_version() const { return exact_; }
    const std::vector<VersionReq>& alternatives() const { return alternatives_; }

    std::string to_string() const;

private:
    std::optional<Version> exact_;
    std::vector<VersionReq> alternatives_;
};

} // namespace skein
