#pragma once

#include <optional>
#include <string>

// One scripted remote command execution.
//
// cmd:   command text to expect; unset accepts any command.
// out:   bytes yielded as remote stdout.
// err:   bytes yielded as remote stderr.
// in:    bytes the caller must have written to stdin; unset skips the check.
// exit:  remote exit code.
// waits: number of exit_status_ready() calls answering false before true.
struct Command {
    std::optional<std::string> cmd;
    std::string out;
    std::string err;
    std::optional<std::string> in;
    int exit = 0;
    int waits = 0;
};
