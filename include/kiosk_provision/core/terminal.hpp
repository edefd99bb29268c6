#pragma once

#include <iosfwd>
#include <string>

namespace kiosk_provision {

namespace ansi {

constexpr const char* kReset  = "\033[0m";
constexpr const char* kBold   = "\033[1m";
constexpr const char* kDim    = "\033[90m";
constexpr const char* kRed    = "\033[1;31m";
constexpr const char* kGreen  = "\033[1;32m";
constexpr const char* kYellow = "\033[33m";
constexpr const char* kCyan   = "\033[36m";

} // namespace ansi

/// Returns true if stderr is a terminal (for colored log output).
bool IsStderrTty();

/// Returns true if stdout is a terminal (for colored table/error output).
bool IsStdoutTty();

/// Returns true if stdin is a terminal (for interactive prompts).
bool IsStdinTty();

/// Returns true if the NO_COLOR environment variable is set (https://no-color.org/).
bool NoColorEnvSet();

/// Read an environment variable; empty string when unset.
std::string GetEnv(const char* name);

/// Enable ANSI escape processing on the Windows console. No-op elsewhere.
void EnableVirtualTerminal();

} // namespace kiosk_provision
