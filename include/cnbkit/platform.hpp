#pragma once

#include <cnbkit/env.hpp>
#include <cnbkit/result.hpp>
#include <filesystem>

namespace cnbkit {

// The platform directory handed to detect and build.
// Layout: <platform>/env/<VAR> holds one user-provided variable per file.
struct Platform {
    std::filesystem::path root;
    Env env;

    // A missing <platform>/env directory yields an empty environment.
    // Directories (and symlinks to directories) inside env/ are skipped.
    static Result<Platform> from_path(const std::filesystem::path& platform_dir);
};

} // namespace cnbkit
