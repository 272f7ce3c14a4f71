#include <skein/version.hpp>
#include <algorithm>
#include <cctype>
#include <sstream>

namespace skein {

// Decimal component without sign or trailing junk ("1x" is rejected,
// unlike std::stoi)
static std::optional<int> parse_component(const std::string& s) {
    if (s.empty() || s.size() > 9) return std::nullopt;
    int value = 0;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
        value = value * 10 + (c - '0');
    }
    return value;
}

static std::string trim(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

// ---------------------------------------------------------------------------
// Version
// ---------------------------------------------------------------------------

// Dot-separated identifiers of a label or build: [0-9A-Za-z-]+ each
static bool valid_identifiers(const std::string& s) {
    if (s.empty() || s.front() == '.' || s.back() == '.') return false;
    for (size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        if (c == '.') {
            if (s[i + 1] == '.') return false;
            continue;
        }
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-') return false;
    }
    return true;
}

static std::vector<std::string> split_identifiers(const std::string& s) {
    std::vector<std::string> out;
    std::istringstream stream(s);
    std::string part;
    while (std::getline(stream, part, '.')) out.push_back(part);
    return out;
}

static bool is_numeric(const std::string& id) {
    return !id.empty() &&
           std::all_of(id.begin(), id.end(), [](char c) {
               return std::isdigit(static_cast<unsigned char>(c)) != 0;
           });
}

// Numeric identifiers as numbers (any length), numeric before alphanumeric,
// otherwise bytewise; a shorter list that is a prefix sorts first
static int compare_identifiers(const std::string& a, const std::string& b) {
    auto xs = split_identifiers(a);
    auto ys = split_identifiers(b);
    for (size_t i = 0; i < xs.size() && i < ys.size(); ++i) {
        const std::string& x = xs[i];
        const std::string& y = ys[i];
        bool xn = is_numeric(x);
        bool yn = is_numeric(y);
        if (xn && yn) {
            std::string xt = x.substr(std::min(x.find_first_not_of('0'), x.size()));
            std::string yt = y.substr(std::min(y.find_first_not_of('0'), y.size()));
            if (xt.size() != yt.size()) return xt.size() < yt.size() ? -1 : 1;
            int c = xt.compare(yt);
            if (c != 0) return c < 0 ? -1 : 1;
        } else if (xn != yn) {
            return xn ? -1 : 1;
        } else {
            int c = x.compare(y);
            if (c != 0) return c < 0 ? -1 : 1;
        }
    }
    if (xs.size() != ys.size()) return xs.size() < ys.size() ? -1 : 1;
    return 0;
}

Result<Version> Version::parse(const std::string& s) {
    if (s.empty()) {
        return SkeinError{SkeinError::Version, "empty version string"};
    }

    std::string core = s;
    Version v;

    size_t plus = core.find('+');
    if (plus != std::string::npos) {
        v.build = core.substr(plus + 1);
        core = core.substr(0, plus);
        if (!valid_identifiers(v.build)) {
            return SkeinError{SkeinError::Version,
                "invalid build metadata in '" + s + "'"};
        }
    }

    size_t dash = core.find('-');
    if (dash != std::string::npos) {
        v.label = core.substr(dash + 1);
        core = core.substr(0, dash);
        if (v.label.empty()) {
            return SkeinError{SkeinError::Version,
                "empty label after '-' in '" + s + "'"};
        }
        if (!valid_identifiers(v.label)) {
            return SkeinError{SkeinError::Version,
                "invalid label in '" + s + "'"};
        }
    }

    size_t dot1 = core.find('.');
    size_t dot2 = dot1 == std::string::npos ? dot1 : core.find('.', dot1 + 1);
    if (dot1 == std::string::npos || dot2 == std::string::npos) {
        return SkeinError{SkeinError::Version,
            "invalid version '" + s + "'",
            "expected format: major.minor.micro[-label][+build]"};
    }

    auto major = parse_component(core.substr(0, dot1));
    auto minor = parse_component(core.substr(dot1 + 1, dot2 - dot1 - 1));
    auto micro = parse_component(core.substr(dot2 + 1));
    if (!major) {
        return SkeinError{SkeinError::Version,
            "invalid major version in '" + s + "'"};
    }
    if (!minor) {
        return SkeinError{SkeinError::Version,
            "invalid minor version in '" + s + "'"};
    }
    if (!micro) {
        return SkeinError{SkeinError::Version,
            "invalid micro version in '" + s + "'"};
    }

    v.major = *major;
    v.minor = *minor;
    v.micro = *micro;
    return Result<Version>::ok(std::move(v));
}

std::string Version::to_string() const {
    std::string s = std::to_string(major) + "." +
                    std::to_string(minor) + "." +
                    std::to_string(micro);
    if (!label.empty()) {
        s += "-" + label;
    }
    if (!build.empty()) {
        s += "+" + build;
    }
    return s;
}

bool Version::operator==(const Version& o) const {
    return !(*this < o) && !(o < *this);
}

bool Version::operator!=(const Version& o) const { return !(*this == o); }

bool Version::operator<(const Version& o) const {
    if (major != o.major) return major < o.major;
    if (minor != o.minor) return minor < o.minor;
    if (micro != o.micro) return micro < o.micro;
    // Pre-release (non-empty label) sorts before the release
    if (label.empty() != o.label.empty()) return o.label.empty();
    if (int c = compare_identifiers(label, o.label)) return c < 0;
    // Build metadata sorts after the plain version
    if (build.empty() != o.build.empty()) return build.empty();
    return compare_identifiers(build, o.build) < 0;
}

bool Version::operator<=(const Version& o) const { return !(o < *this); }
bool Version::operator>(const Version& o) const { return o < *this; }
bool Version::operator>=(const Version& o) const { return !(*this < o); }

// ---------------------------------------------------------------------------
// PartialVersion
// ---------------------------------------------------------------------------

Result<PartialVersion> PartialVersion::parse(const std::string& s) {
    if (s.empty()) {
        return SkeinError{SkeinError::Version, "empty partial version string"};
    }

    std::vector<std::string> parts;
    std::istringstream stream(s);
    std::string part;
    while (std::getline(stream, part, '.')) {
        parts.push_back(part);
    }
    if (s.back() == '.' || parts.empty() || parts.size() > 3) {
        return SkeinError{SkeinError::Version,
            "invalid partial version '" + s + "'",
            "expected 1, 1.2 or 1.2.3"};
    }

    int fields[3] = {0, -1, -1};
    for (size_t i = 0; i < parts.size(); ++i) {
        auto n = parse_component(parts[i]);
        if (!n) {
            return SkeinError{SkeinError::Version,
                "invalid partial version '" + s + "'"};
        }
        fields[i] = *n;
    }

    PartialVersion pv;
    pv.major = fields[0];
    pv.minor = fields[1];
    pv.micro = fields[2];
    return Result<PartialVersion>::ok(pv);
}

std::string PartialVersion::to_string() const {
    std::string s = std::to_string(major);
    if (minor >= 0) {
        s += "." + std::to_string(minor);
        if (micro >= 0) {
            s += "." + std::to_string(micro);
        }
    }
    return s;
}

// ---------------------------------------------------------------------------
// VersionConstraint
// ---------------------------------------------------------------------------

bool VersionConstraint::matches(const Version& v) const {
    if (op == ConstraintOp::Any) return true;

    Version req;
    req.major = version.major;
    req.minor = version.minor >= 0 ? version.minor : 0;
    req.micro = version.micro >= 0 ? version.micro : 0;

    // Pre-releases only satisfy wildcard specs or an exact version spec
    if (!v.label.empty()) return false;

    // Ranges bound the numeric core; build metadata does not move a version
    // across a bound
    Version core = v;
    core.build.clear();

    switch (op) {
    case ConstraintOp::Exact:
        // "=1.2" pins major.minor, "=1" pins major
        if (v.major != req.major) return false;
        if (version.minor >= 0 && v.minor != req.minor) return false;
        if (version.micro >= 0 && v.micro != req.micro) return false;
        return true;

    case ConstraintOp::Caret:
        // ^X.Y.Z (X>0): >=X.Y.Z, <(X+1).0.0
        // ^0.Y.Z (Y>0): >=0.Y.Z, <0.(Y+1).0
        // ^0.0.Z:       only 0.0.Z
        if (core < req) return false;
        if (req.major > 0 || version.minor < 0) {
            return v.major == req.major;
        }
        if (req.minor > 0 || version.micro < 0) {
            return v.major == 0 && v.minor == req.minor;
        }
        return v.major == 0 && v.minor == 0 && v.micro == req.micro;

    case ConstraintOp::Tilde:
        // ~X.Y.Z: >=X.Y.Z, <X.(Y+1).0; ~X: >=X.0.0, <(X+1).0.0
        if (core < req) return false;
        if (version.minor < 0) return v.major == req.major;
        return v.major == req.major && v.minor == req.minor;

    case ConstraintOp::GreaterEq:
        return core >= req;

    case ConstraintOp::Greater:
        return core > req;

    case ConstraintOp::LessEq:
        return core <= req;

    case ConstraintOp::Less:
        return core < req;

    case ConstraintOp::Any:
        return true;
    }
    return false;
}

std::string VersionConstraint::to_string() const {
    std::string prefix;
    switch (op) {
    case ConstraintOp::Exact:     prefix = "="; break;
    case ConstraintOp::Caret:     prefix = "^"; break;
    case ConstraintOp::Tilde:     prefix = "~"; break;
    case ConstraintOp::GreaterEq: prefix = ">="; break;
    case ConstraintOp::Greater:   prefix = ">"; break;
    case ConstraintOp::LessEq:    prefix = "<="; break;
    case ConstraintOp::Less:      prefix = "<"; break;
    case ConstraintOp::Any:       return "*";
    }
    return prefix + version.to_string();
}

// ---------------------------------------------------------------------------
// VersionReq
// ---------------------------------------------------------------------------

static Result<VersionConstraint> parse_single_constraint(const std::string& raw) {
    std::string s = trim(raw);
    VersionConstraint vc;

    if (s == "*") {
        vc.op = ConstraintOp::Any;
        return Result<VersionConstraint>::ok(vc);
    }

    size_t pos = 0;
    vc.op = ConstraintOp::Caret;  // no prefix = caret, like Cargo
    if (s.compare(0, 2, ">=") == 0) {
        vc.op = ConstraintOp::GreaterEq;
        pos = 2;
    } else if (s.compare(0, 2, "<=") == 0) {
        vc.op = ConstraintOp::LessEq;
        pos = 2;
    } else if (!s.empty()) {
        switch (s[0]) {
        case '^': vc.op = ConstraintOp::Caret; pos = 1; break;
        case '~': vc.op = ConstraintOp::Tilde; pos = 1; break;
        case '=': vc.op = ConstraintOp::Exact; pos = 1; break;
        case '>': vc.op = ConstraintOp::Greater; pos = 1; break;
        case '<': vc.op = ConstraintOp::Less; pos = 1; break;
        default: break;
        }
    }

    std::string ver_str = trim(s.substr(pos));
    if (ver_str.empty()) {
        return SkeinError{SkeinError::Version,
            "missing version in constraint '" + raw + "'"};
    }

    auto pv = PartialVersion::parse(ver_str);
    if (pv.is_err()) return std::move(pv).error();

    vc.version = pv.value();
    return Result<VersionConstraint>::ok(vc);
}

Result<VersionReq> VersionReq::parse(const std::string& s) {
    if (trim(s).empty()) {
        return SkeinError{SkeinError::Version, "empty version requirement"};
    }

    VersionReq req;
    std::istringstream stream(s);
    std::string token;

    while (std::getline(stream, token, ',')) {
        auto c = parse_single_constraint(token);
        if (c.is_err()) return std::move(c).error();
        req.constraints.push_back(std::move(c).value());
    }

    if (req.constraints.empty()) {
        return SkeinError{SkeinError::Version,
            "no constraints in version requirement '" + s + "'"};
    }

    return Result<VersionReq>::ok(std::move(req));
}

bool VersionReq::matches(const Version& v) const {
    return std::all_of(constraints.begin(), constraints.end(),
        [&](const VersionConstraint& c) { return c.matches(v); });
}

std::string VersionReq::to_string() const {
    std::string s;
    for (size_t i = 0; i < constraints.size(); ++i) {
        if (i > 0) s += ", ";
        s += constraints[i].to_string();
    }
    return s;
}

// ---------------------------------------------------------------------------
// VersionSpec
// ---------------------------------------------------------------------------

VersionSpec VersionSpec::any() {
    return VersionSpec();
}

VersionSpec VersionSpec::exact(Version v) {
    VersionSpec spec;
    spec.exact_ = std::move(v);
    return spec;
}

VersionSpec VersionSpec::ranges(std::vector<VersionReq> alternatives) {
    VersionSpec spec;
    spec.alternatives_ = std::move(alternatives);
    return spec;
}

Result<VersionSpec> VersionSpec::parse(const std::string& s) {
    std::string text = trim(s);
    if (text.empty() || text == "*") {
        return Result<VersionSpec>::ok(any());
    }

    // "=1.2.3-rc1" names one version, label included
    if (text[0] == '=' && text.find_first_of(",|") == std::string::npos) {
        auto v = Version::parse(trim(text.substr(1)));
        if (v.is_ok()) {
            return Result<VersionSpec>::ok(exact(std::move(v).value()));
        }
    }

    std::vector<VersionReq> alternatives;
    size_t start = 0;
    while (start <= text.size()) {
        size_t bar = text.find("||", start);
        std::string piece = text.substr(start, bar == std::string::npos
                                                   ? std::string::npos
                                                   : bar - start);
        auto req = VersionReq::parse(piece);
        if (req.is_err()) return std::move(req).error();
        alternatives.push_back(std::move(req).value());
        if (bar == std::string::npos) break;
        start = bar + 2;
    }

    return Result<VersionSpec>::ok(ranges(std::move(alternatives)));
}

bool VersionSpec::matches(const Version& v) const {
    if (exact_) return *exact_ == v;
    if (alternatives_.empty()) return true;
    return std::any_of(alternatives_.begin(), alternatives_.end(),
        [&](const VersionReq& r) { return r.matches(v); });
}

bool VersionSpec::is_any() const {
    return !exact_ && alternatives_.empty();
}

std::string VersionSpec::to_string() const {
    if (exact_) return "=" + exact_->to_string();
    if (alternatives_.empty()) return "*";
    std::string s;
    for (size_t i = 0; i < alternatives_.size(); ++i) {
        if (i > 0) s += " || ";
        s += alternatives_[i].to_string();
    }
    return s;
}

} // namespace skein
