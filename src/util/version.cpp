#include <cnbkit/version.hpp>
#include <cctype>

namespace cnbkit {

// Parse a non-negative decimal component. Rejects empty strings, signs,
// trailing garbage and (optionally) leading zeroes.
static bool parse_component(const std::string& s, bool allow_leading_zero,
                            int& out) {
    if (s.empty() || s.size() > 9) return false;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    if (!allow_leading_zero && s.size() > 1 && s[0] == '0') return false;
    out = std::stoi(s);
    return true;
}

// ---------------------------------------------------------------------------
// Version
// ---------------------------------------------------------------------------

Result<Version> Version::parse(const std::string& s) {
    if (s.empty()) {
        return CnbError{CnbError::Parse, "empty version string"};
    }

    Version v;
    std::string core = s;
    size_t dash = s.find('-');
    if (dash != std::string::npos) {
        core = s.substr(0, dash);
        v.label = s.substr(dash + 1);
        if (v.label.empty()) {
            return CnbError{CnbError::Parse,
                "empty label after '-' in '" + s + "'"};
        }
    }

    size_t dot1 = core.find('.');
    size_t dot2 = dot1 == std::string::npos ? std::string::npos
                                            : core.find('.', dot1 + 1);
    if (dot1 == std::string::npos || dot2 == std::string::npos ||
        core.find('.', dot2 + 1) != std::string::npos) {
        return CnbError{CnbError::Parse,
            "invalid version '" + s + "'",
            "expected format: major.minor.micro[-label]"};
    }

    if (!parse_component(core.substr(0, dot1), false, v.major) ||
        !parse_component(core.substr(dot1 + 1, dot2 - dot1 - 1), false, v.minor) ||
        !parse_component(core.substr(dot2 + 1), false, v.micro)) {
        return CnbError{CnbError::Parse,
            "invalid version '" + s + "'",
            "components must be non-negative integers without leading zeroes"};
    }

    return Result<Version>::ok(std::move(v));
}

std::string Version::to_string() const {
    std::string s = std::to_string(major) + "." +
                    std::to_string(minor) + "." +
                    std::to_string(micro);
    if (!label.empty()) {
        s += "-" + label;
    }
    return s;
}

bool Version::operator==(const Version& o) const {
    return major == o.major && minor == o.minor &&
           micro == o.micro && label == o.label;
}

bool Version::operator!=(const Version& o) const { return !(*this == o); }

bool Version::operator<(const Version& o) const {
    if (major != o.major) return major < o.major;
    if (minor != o.minor) return minor < o.minor;
    if (micro != o.micro) return micro < o.micro;
    // Pre-release (non-empty label) < release (empty label)
    if (label.empty() && !o.label.empty()) return false;
    if (!label.empty() && o.label.empty()) return true;
    return label < o.label;
}

// ---------------------------------------------------------------------------
// BuildpackApi
// ---------------------------------------------------------------------------

Result<BuildpackApi> BuildpackApi::parse(const std::string& s) {
    BuildpackApi api;
    size_t dot = s.find('.');
    bool ok = false;
    if (dot == std::string::npos) {
        ok = parse_component(s, true, api.major);
    } else {
        ok = parse_component(s.substr(0, dot), true, api.major) &&
             parse_component(s.substr(dot + 1), true, api.minor);
    }

    if (!ok) {
        return CnbError{CnbError::Parse,
            "invalid Buildpack API version '" + s + "'",
            "value must be in the form <major>.<minor> or <major> and only contain numbers"};
    }
    return Result<BuildpackApi>::ok(api);
}

std::string BuildpackApi::to_string() const {
    return std::to_string(major) + "." + std::to_string(minor);
}

bool BuildpackApi::operator==(const BuildpackApi& o) const {
    return major == o.major && minor == o.minor;
}

bool BuildpackApi::operator!=(const BuildpackApi& o) const { return !(*this == o); }

} // namespace cnbkit
