#pragma once

#include <cnbkit/result.hpp>
#include <array>
#include <filesystem>
#include <string>

namespace cnbkit {

enum class SbomFormat {
    CycloneDxJson,
    SpdxJson,
    SyftJson,
};

inline constexpr std::array<SbomFormat, 3> SBOM_FORMATS = {
    SbomFormat::CycloneDxJson, SbomFormat::SpdxJson, SbomFormat::SyftJson};

// "application/vnd.cyclonedx+json", ...
const char* sbom_media_type(SbomFormat format);

// "cdx.json", "spdx.json", "syft.json"
const char* sbom_file_suffix(SbomFormat format);

Result<SbomFormat> parse_sbom_media_type(const std::string& media_type);

// <base_dir>/<base_name>.sbom.<suffix>
std::filesystem::path sbom_path(SbomFormat format,
                                const std::filesystem::path& base_dir,
                                const std::string& base_name);

struct Sbom {
    SbomFormat format;
    std::string data;

    static Sbom from_bytes(SbomFormat format, std::string data);
    static Result<Sbom> from_path(SbomFormat format, const std::filesystem::path& path);
};

} // namespace cnbkit
