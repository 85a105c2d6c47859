#pragma once

#include <cnbkit/result.hpp>
#include <toml++/toml.hpp>
#include <filesystem>
#include <string>

namespace cnbkit {

// Parse TOML text. `origin` names the source in error messages.
Result<toml::table> parse_toml_string(const std::string& toml_str,
                                      const std::string& origin);

// Read and parse a TOML file. A missing file is reported as NotFound so
// callers can treat optional files (store.toml) as absent.
Result<toml::table> read_toml_file(const std::filesystem::path& path);

// Serialize a table to TOML text
std::string to_toml_string(const toml::table& tbl);

// Write a TOML file through a sibling temp file and a rename, so readers
// never observe a partially written file.
Status write_toml_file(const toml::table& tbl, const std::filesystem::path& path);

// Raw file helpers shared by the env, SBOM and platform readers
Result<std::string> read_file(const std::filesystem::path& path);
Status write_file(const std::filesystem::path& path, const std::string& contents);
Status write_file_atomic(const std::filesystem::path& path, const std::string& contents);

} // namespace cnbkit
