#pragma once

namespace cnbkit::exit_code {

inline constexpr int SUCCESS = 0;
inline constexpr int GENERIC_FAILURE = 1;      // author error
inline constexpr int CONTRACT_VIOLATION = 2;   // arguments, env, descriptor
inline constexpr int FRAMEWORK_MISUSE = 3;
inline constexpr int IO_FAILURE = 4;           // persisting results
inline constexpr int UNEXPECTED = 5;           // uncaught exception
inline constexpr int DETECT_FAILED = 100;
inline constexpr int API_MISMATCH = 254;
inline constexpr int UNKNOWN_EXECUTABLE = 255;

} // namespace cnbkit::exit_code
