#pragma once

#include <optional>
#include <string>

namespace execbox {

// Termination status of a sandboxed process, as waitid() reports it in siginfo_t
struct Si {
    int code; // CLD_EXITED, CLD_KILLED, CLD_DUMPED, ...
    int status; // exit code or signal number, depending on code

    // Set iff the process exited normally
    [[nodiscard]] std::optional<int> exit_code() const noexcept;

    // Set iff the process was killed by a signal (with or without a core dump)
    [[nodiscard]] std::optional<int> killing_signal() const noexcept;

    // E.g. "exited with 1" or "killed by signal SIGKILL - Killed"
    [[nodiscard]] std::string description() const;

    [[nodiscard]] bool operator==(const Si& other) const noexcept {
        return code == other.code && status == other.status;
    }

    [[nodiscard]] bool operator!=(const Si& other) const noexcept { return !(*this == other); }
};

} // namespace execbox
