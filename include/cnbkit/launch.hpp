#pragma once

#include <cnbkit/name.hpp>
#include <cnbkit/result.hpp>
#include <toml++/toml.hpp>
#include <optional>
#include <string>
#include <vector>

namespace cnbkit {

// [[processes]] entry of launch.toml
struct Process {
    ProcessType type;
    std::vector<std::string> command;
    std::vector<std::string> args;
    bool default_ = false;
    std::optional<std::string> working_directory;
    bool direct = false;
};

// [[slices]] entry: path globs relative to the app directory
struct Slice {
    std::vector<std::string> paths;
};

// [[labels]] entry
struct Label {
    std::string key;
    std::string value;
};

struct Launch {
    std::vector<Process> processes;
    std::vector<Slice> slices;
    std::vector<Label> labels;

    // launch.toml is only written for a non-empty launch
    bool empty() const;

    toml::table to_toml() const;
    static Result<Launch> from_toml(const toml::table& tbl);
};

// Builds one process. Setters that can fail record the first error, which
// build() reports.
class ProcessBuilder {
public:
    ProcessBuilder(ProcessType type, std::string command);
    ProcessBuilder(ProcessType type, std::vector<std::string> command);

    ProcessBuilder& arg(std::string a);
    ProcessBuilder& args(const std::vector<std::string>& as);
    ProcessBuilder& default_(bool value = true);
    ProcessBuilder& direct(bool value = true);
    ProcessBuilder& working_directory(std::string dir);

    Result<Process> build() const;

private:
    Process process_;
    std::optional<CnbError> error_;
};

class LaunchBuilder {
public:
    LaunchBuilder& process(Process p);
    LaunchBuilder& processes(std::vector<Process> ps);
    LaunchBuilder& slice(Slice s);
    LaunchBuilder& label(std::string key, std::string value);

    // Rejects a second default process and invalid slices/labels
    Result<Launch> build() const;

private:
    Launch launch_;
    std::optional<CnbError> error_;
};

// Cross-field checks shared by LaunchBuilder and BuildResultBuilder
Status validate_launch(const Launch& launch);

} // namespace cnbkit
