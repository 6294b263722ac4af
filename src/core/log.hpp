#pragma once

#include <string>
#include <core/types.hpp>

// Debug log for harness and client activity.
// Disabled unless SSHFAKE_LOG is set to 1/true/yes/on. Lines go to
// SSHFAKE_LOG_PATH if set, otherwise <tmp>/sshfake_debug.log.
// Settings are read from the environment on every call so tests can toggle them.

bool sshfake_log_enabled();
std::string sshfake_log_path();

// Append a "[HH:MM:SS.mmm] msg" line. No-op when logging is disabled.
void sshfake_log(const std::string& msg);

// Log a command and a truncated preview of its result.
void sshfake_log_exec(const std::string& label, const std::string& cmd,
                      const ExecResult& r);
