#include <cnbkit/launch.hpp>

#include <set>

namespace cnbkit {

// ---------------------------------------------------------------------------
// Validation
// ---------------------------------------------------------------------------

static Status validate_slice_path(const std::string& glob) {
    if (glob.empty()) {
        return CnbError{CnbError::FrameworkMisuse, "slice path glob must not be empty"};
    }
    if (glob.front() == '/') {
        return CnbError{CnbError::FrameworkMisuse,
            "slice path glob '" + glob + "' must be relative to the app directory"};
    }
    // Reject any ".." segment
    size_t start = 0;
    while (start <= glob.size()) {
        size_t end = glob.find('/', start);
        if (end == std::string::npos) end = glob.size();
        if (glob.compare(start, end - start, "..") == 0) {
            return CnbError{CnbError::FrameworkMisuse,
                "slice path glob '" + glob + "' must not contain '..'"};
        }
        start = end + 1;
    }
    return ok_status();
}

static Status validate_process(const Process& p) {
    if (p.type.str().empty()) {
        return CnbError{CnbError::FrameworkMisuse,
            std::string(p.default_ ? "default " : "") + "process has no type",
            "build processes with ProcessBuilder and a parsed ProcessType"};
    }
    if (p.command.empty() || p.command[0].empty()) {
        return CnbError{CnbError::FrameworkMisuse,
            "process '" + p.type.str() + "' has an empty command"};
    }
    if (p.working_directory) {
        const auto& dir = *p.working_directory;
        if (dir.empty() || dir.find('\0') != std::string::npos) {
            return CnbError{CnbError::FrameworkMisuse,
                "process '" + p.type.str() + "' has an invalid working directory"};
        }
    }
    return ok_status();
}

Status validate_launch(const Launch& launch) {
    std::set<std::string> types;
    const Process* default_process = nullptr;
    for (const auto& p : launch.processes) {
        CNBKIT_TRY(validate_process(p));
        if (!types.insert(p.type.str()).second) {
            return CnbError{CnbError::FrameworkMisuse,
                "process type '" + p.type.str() + "' is declared more than once"};
        }
        if (p.default_) {
            if (default_process) {
                return CnbError{CnbError::FrameworkMisuse,
                    "processes '" + default_process->type.str() + "' and '" + p.type.str()
                        + "' are both marked default",
                    "at most one process can be the default"};
            }
            default_process = &p;
        }
    }
    for (const auto& s : launch.slices) {
        if (s.paths.empty()) {
            return CnbError{CnbError::FrameworkMisuse, "slice has no paths"};
        }
        for (const auto& glob : s.paths) {
            CNBKIT_TRY(validate_slice_path(glob));
        }
    }
    for (const auto& l : launch.labels) {
        if (l.key.empty()) {
            return CnbError{CnbError::FrameworkMisuse, "label key must not be empty"};
        }
    }
    return ok_status();
}

// ---------------------------------------------------------------------------
// Launch serialization
// ---------------------------------------------------------------------------

static toml::array string_array(const std::vector<std::string>& items) {
    toml::array arr;
    for (const auto& s : items) arr.push_back(s);
    return arr;
}

bool Launch::empty() const {
    return processes.empty() && slices.empty() && labels.empty();
}

toml::table Launch::to_toml() const {
    toml::table tbl;

    if (!processes.empty()) {
        toml::array arr;
        for (const auto& p : processes) {
            toml::table t;
            t.insert("type", p.type.str());
            t.insert("command", string_array(p.command));
            t.insert("args", string_array(p.args));
            t.insert("default", p.default_);
            if (p.working_directory) t.insert("working-dir", *p.working_directory);
            if (p.direct) t.insert("direct", true);
            arr.push_back(std::move(t));
        }
        tbl.insert("processes", std::move(arr));
    }

    if (!slices.empty()) {
        toml::array arr;
        for (const auto& s : slices) {
            arr.push_back(toml::table{{"paths", string_array(s.paths)}});
        }
        tbl.insert("slices", std::move(arr));
    }

    if (!labels.empty()) {
        toml::array arr;
        for (const auto& l : labels) {
            arr.push_back(toml::table{{"key", l.key}, {"value", l.value}});
        }
        tbl.insert("labels", std::move(arr));
    }

    return tbl;
}

static std::vector<std::string> read_strings(const toml::node* node) {
    std::vector<std::string> out;
    if (!node) return out;
    if (auto s = node->value<std::string>()) {
        out.push_back(*s);
    } else if (auto arr = node->as_array()) {
        for (const auto& elem : *arr) {
            if (auto v = elem.value<std::string>()) out.push_back(*v);
        }
    }
    return out;
}

Result<Launch> Launch::from_toml(const toml::table& tbl) {
    Launch launch;

    if (auto arr = tbl["processes"].as_array()) {
        for (const auto& elem : *arr) {
            auto t = elem.as_table();
            if (!t) return CnbError{CnbError::Parse, "[[processes]] entries must be tables"};
            auto type_str = (*t)["type"].value<std::string>();
            if (!type_str) return CnbError{CnbError::Parse, "process is missing 'type'"};
            auto type = ProcessType::parse(*type_str);
            if (type.is_err()) return std::move(type).error();

            Process p{std::move(type).value(), {}, {}, false, std::nullopt, false};
            p.command = read_strings(t->get("command"));
            p.args = read_strings(t->get("args"));
            if (auto v = (*t)["default"].value<bool>()) p.default_ = *v;
            if (auto v = (*t)["working-dir"].value<std::string>()) p.working_directory = *v;
            if (auto v = (*t)["direct"].value<bool>()) p.direct = *v;
            launch.processes.push_back(std::move(p));
        }
    }

    if (auto arr = tbl["slices"].as_array()) {
        for (const auto& elem : *arr) {
            auto t = elem.as_table();
            if (!t) return CnbError{CnbError::Parse, "[[slices]] entries must be tables"};
            launch.slices.push_back(Slice{read_strings(t->get("paths"))});
        }
    }

    if (auto arr = tbl["labels"].as_array()) {
        for (const auto& elem : *arr) {
            auto t = elem.as_table();
            if (!t) return CnbError{CnbError::Parse, "[[labels]] entries must be tables"};
            Label l;
            if (auto v = (*t)["key"].value<std::string>()) l.key = *v;
            if (auto v = (*t)["value"].value<std::string>()) l.value = *v;
            launch.labels.push_back(std::move(l));
        }
    }

    return Result<Launch>::ok(std::move(launch));
}

// ---------------------------------------------------------------------------
// ProcessBuilder
// ---------------------------------------------------------------------------

ProcessBuilder::ProcessBuilder(ProcessType type, std::string command)
    : ProcessBuilder(std::move(type), std::vector<std::string>{std::move(command)}) {}

ProcessBuilder::ProcessBuilder(ProcessType type, std::vector<std::string> command) {
    process_.type = std::move(type);
    process_.command = std::move(command);
    if (process_.command.empty() || process_.command[0].empty()) {
        error_ = CnbError{CnbError::FrameworkMisuse,
            "process '" + process_.type.str() + "' has an empty command"};
    }
}

ProcessBuilder& ProcessBuilder::arg(std::string a) {
    process_.args.push_back(std::move(a));
    return *this;
}

ProcessBuilder& ProcessBuilder::args(const std::vector<std::string>& as) {
    process_.args.insert(process_.args.end(), as.begin(), as.end());
    return *this;
}

ProcessBuilder& ProcessBuilder::default_(bool value) {
    process_.default_ = value;
    return *this;
}

ProcessBuilder& ProcessBuilder::direct(bool value) {
    process_.direct = value;
    return *this;
}

ProcessBuilder& ProcessBuilder::working_directory(std::string dir) {
    if (!error_ && (dir.empty() || dir.find('\0') != std::string::npos)) {
        error_ = CnbError{CnbError::FrameworkMisuse,
            "process '" + process_.type.str() + "' has an invalid working directory"};
    }
    process_.working_directory = std::move(dir);
    return *this;
}

Result<Process> ProcessBuilder::build() const {
    if (error_) return *error_;
    return Result<Process>::ok(process_);
}

// ---------------------------------------------------------------------------
// LaunchBuilder
// ---------------------------------------------------------------------------

LaunchBuilder& LaunchBuilder::process(Process p) {
    launch_.processes.push_back(std::move(p));
    return *this;
}

LaunchBuilder& LaunchBuilder::processes(std::vector<Process> ps) {
    for (auto& p : ps) launch_.processes.push_back(std::move(p));
    return *this;
}

LaunchBuilder& LaunchBuilder::slice(Slice s) {
    if (!error_) {
        if (s.paths.empty()) {
            error_ = CnbError{CnbError::FrameworkMisuse, "slice has no paths"};
        }
        for (const auto& glob : s.paths) {
            if (error_) break;
            auto st = validate_slice_path(glob);
            if (st.is_err()) error_ = std::move(st).error();
        }
    }
    launch_.slices.push_back(std::move(s));
    return *this;
}

LaunchBuilder& LaunchBuilder::label(std::string key, std::string value) {
    if (!error_ && key.empty()) {
        error_ = CnbError{CnbError::FrameworkMisuse, "label key must not be empty"};
    }
    launch_.labels.push_back(Label{std::move(key), std::move(value)});
    return *this;
}

Result<Launch> LaunchBuilder::build() const {
    if (error_) return *error_;
    CNBKIT_TRY(validate_launch(launch_));
    return Result<Launch>::ok(launch_);
}

} // namespace cnbkit
