#include <cnbkit/sbom.hpp>
#include <cnbkit/toml_file.hpp>

namespace fs = std::filesystem;

namespace cnbkit {

const char* sbom_media_type(SbomFormat format) {
    switch (format) {
        case SbomFormat::CycloneDxJson: return "application/vnd.cyclonedx+json";
        case SbomFormat::SpdxJson:      return "application/spdx+json";
        case SbomFormat::SyftJson:      return "application/vnd.syft+json";
    }
    return "";
}

const char* sbom_file_suffix(SbomFormat format) {
    switch (format) {
        case SbomFormat::CycloneDxJson: return "cdx.json";
        case SbomFormat::SpdxJson:      return "spdx.json";
        case SbomFormat::SyftJson:      return "syft.json";
    }
    return "";
}

Result<SbomFormat> parse_sbom_media_type(const std::string& media_type) {
    for (SbomFormat format : SBOM_FORMATS) {
        if (media_type == sbom_media_type(format)) {
            return Result<SbomFormat>::ok(format);
        }
    }
    return CnbError{CnbError::InvalidArg,
        "unsupported SBOM media type '" + media_type + "'",
        "supported: application/vnd.cyclonedx+json, application/spdx+json, application/vnd.syft+json"};
}

fs::path sbom_path(SbomFormat format, const fs::path& base_dir,
                   const std::string& base_name) {
    return base_dir / (base_name + ".sbom." + sbom_file_suffix(format));
}

Sbom Sbom::from_bytes(SbomFormat format, std::string data) {
    return Sbom{format, std::move(data)};
}

Result<Sbom> Sbom::from_path(SbomFormat format, const fs::path& path) {
    auto data = read_file(path);
    if (data.is_err()) return std::move(data).error();
    return Result<Sbom>::ok(Sbom{format, std::move(data).value()});
}

} // namespace cnbkit
