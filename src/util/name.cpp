#include <cnbkit/name.hpp>
#include <array>
#include <cctype>

namespace cnbkit {

static bool is_lower_alnum(char c) {
    return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9');
}

static bool is_alnum(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0;
}

// ---------------------------------------------------------------------------
// LayerName
// ---------------------------------------------------------------------------

Result<LayerName> LayerName::parse(const std::string& raw) {
    if (raw.empty()) {
        return CnbError{CnbError::InvalidArg, "empty layer name"};
    }

    static const std::array<const char*, 6> reserved = {
        "build", "launch", "store", "env", "sbom", "exec.d"};
    for (const char* r : reserved) {
        if (raw == r) {
            return CnbError{CnbError::InvalidArg,
                "layer name '" + raw + "' is reserved",
                "reserved names: build, launch, store, env, sbom, exec.d"};
        }
    }

    for (char c : raw) {
        if (!is_lower_alnum(c) && c != '.' && c != '-' && c != '_') {
            return CnbError{CnbError::InvalidArg,
                "invalid character '" + std::string(1, c) +
                "' in layer name '" + raw + "'",
                "allowed: [a-z0-9._-]"};
        }
    }

    if (raw == "." || raw == "..") {
        return CnbError{CnbError::InvalidArg,
            "layer name '" + raw + "' is not a valid directory name"};
    }

    LayerName name;
    name.value_ = raw;
    return Result<LayerName>::ok(std::move(name));
}

const std::string& LayerName::str() const { return value_; }

bool LayerName::operator==(const LayerName& o) const { return value_ == o.value_; }
bool LayerName::operator!=(const LayerName& o) const { return !(*this == o); }
bool LayerName::operator<(const LayerName& o) const { return value_ < o.value_; }

// ---------------------------------------------------------------------------
// ProcessType
// ---------------------------------------------------------------------------

Result<ProcessType> ProcessType::parse(const std::string& raw) {
    if (raw.empty()) {
        return CnbError{CnbError::InvalidArg, "empty process type"};
    }

    for (char c : raw) {
        if (!is_alnum(c) && c != '.' && c != '-' && c != '_') {
            return CnbError{CnbError::InvalidArg,
                "invalid character '" + std::string(1, c) +
                "' in process type '" + raw + "'",
                "allowed: [A-Za-z0-9._-]"};
        }
    }

    ProcessType type;
    type.value_ = raw;
    return Result<ProcessType>::ok(std::move(type));
}

const std::string& ProcessType::str() const { return value_; }

bool ProcessType::operator==(const ProcessType& o) const { return value_ == o.value_; }
bool ProcessType::operator!=(const ProcessType& o) const { return !(*this == o); }

// ---------------------------------------------------------------------------
// BuildpackId
// ---------------------------------------------------------------------------

Result<BuildpackId> BuildpackId::parse(const std::string& raw) {
    if (raw.empty()) {
        return CnbError{CnbError::InvalidArg, "empty buildpack id"};
    }

    if (raw == "app" || raw == "config") {
        return CnbError{CnbError::InvalidArg,
            "buildpack id '" + raw + "' is reserved"};
    }

    for (char c : raw) {
        if (!is_alnum(c) && c != '.' && c != '/' && c != '-') {
            return CnbError{CnbError::InvalidArg,
                "invalid character '" + std::string(1, c) +
                "' in buildpack id '" + raw + "'",
                "allowed: [A-Za-z0-9./-]"};
        }
    }

    BuildpackId id;
    id.value_ = raw;
    return Result<BuildpackId>::ok(std::move(id));
}

const std::string& BuildpackId::str() const { return value_; }

bool BuildpackId::operator==(const BuildpackId& o) const { return value_ == o.value_; }
bool BuildpackId::operator!=(const BuildpackId& o) const { return !(*this == o); }

} // namespace cnbkit
