#pragma once

#include <optional>
#include <string>

namespace cnbkit::log {

enum Level { Trace, Debug, Info, Warn, Error };

void set_level(Level lvl);
Level get_level();

void set_color_enabled(bool enabled);
bool is_color_enabled();

// Phase tag printed in front of every message, e.g. "[build]".
// Empty disables the tag.
void set_phase(const std::string& phase);
const std::string& get_phase();

void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

const char* level_name(Level lvl);

// Inverse of level_name; accepts "warning" as an alias for "warn"
std::optional<Level> parse_level(const std::string& name);

} // namespace cnbkit::log
