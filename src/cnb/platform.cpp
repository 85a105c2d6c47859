#include <cnbkit/platform.hpp>
#include <cnbkit/toml_file.hpp>

namespace fs = std::filesystem;

namespace cnbkit {

Result<Platform> Platform::from_path(const fs::path& platform_dir) {
    Platform platform;
    platform.root = platform_dir;

    fs::path env_dir = platform_dir / "env";
    std::error_code ec;
    if (!fs::is_directory(env_dir, ec)) {
        return Result<Platform>::ok(std::move(platform));
    }

    fs::directory_iterator it(env_dir, ec);
    if (ec) {
        return CnbError{CnbError::IO,
            "cannot read platform env directory " + env_dir.string() + ": " + ec.message()};
    }

    for (const auto& entry : it) {
        if (!entry.is_regular_file(ec)) continue;

        auto contents = read_file(entry.path());
        if (contents.is_err()) return std::move(contents).error();
        platform.env.insert(entry.path().filename().string(), contents.value());
    }

    return Result<Platform>::ok(std::move(platform));
}

} // namespace cnbkit
