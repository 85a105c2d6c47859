#include <cnbkit/toml_file.hpp>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace cnbkit {

Result<toml::table> parse_toml_string(const std::string& toml_str,
                                      const std::string& origin) {
    try {
        toml::table doc = toml::parse(toml_str, origin);
        return Result<toml::table>::ok(std::move(doc));
    } catch (const toml::parse_error& e) {
        int line = static_cast<int>(e.source().begin.line);
        return CnbError{CnbError::Parse,
            std::string("TOML parse error: ") + std::string(e.description()),
            "", origin, line};
    }
}

Result<std::string> read_file(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return CnbError{CnbError::NotFound,
            "file does not exist: " + path.string()};
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return CnbError{CnbError::IO,
            "cannot open file: " + path.string()};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return Result<std::string>::ok(ss.str());
}

Result<toml::table> read_toml_file(const fs::path& path) {
    auto contents = read_file(path);
    if (contents.is_err()) return std::move(contents).error();
    return parse_toml_string(contents.value(), path.string());
}

std::string to_toml_string(const toml::table& tbl) {
    std::ostringstream ss;
    ss << tbl;
    if (!tbl.empty()) ss << "\n";
    return ss.str();
}

Status write_file(const fs::path& path, const std::string& contents) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return CnbError{CnbError::IO,
            "cannot open file for writing: " + path.string()};
    }
    out << contents;
    out.flush();
    if (!out) {
        return CnbError{CnbError::IO,
            "failed to write file: " + path.string()};
    }
    return ok_status();
}

Status write_file_atomic(const fs::path& path, const std::string& contents) {
    fs::path tmp = path;
    tmp += ".tmp";

    CNBKIT_TRY(write_file(tmp, contents));

    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        std::string reason = ec.message();
        fs::remove(tmp, ec);
        return CnbError{CnbError::IO,
            "failed to move " + tmp.string() + " into place: " + reason};
    }
    return ok_status();
}

Status write_toml_file(const toml::table& tbl, const fs::path& path) {
    return write_file_atomic(path, to_toml_string(tbl));
}

} // namespace cnbkit
