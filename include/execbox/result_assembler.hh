#pragma once

#include <execbox/execution_result.hh>
#include <execbox/io_channel.hh>
#include <execbox/sandbox_controller.hh>
#include <execbox/si.hh>
#include <optional>
#include <string>
#include <string_view>

namespace execbox {

/**
 * @brief Decides the terminal state of a sandbox
 * @details Once the controller sent the termination signal, the timeout (or cancellation)
 *   takes precedence over an exit that raced with it. Otherwise the exit status decides:
 *   COMPLETED for any exit code, SIGNALED if the process was killed by a signal.
 */
[[nodiscard]] SandboxState classify_termination(
    const Si& si, std::optional<SandboxState> termination_cause, bool termination_signal_sent
) noexcept;

// Builds the result record out of already collected data, does not touch the sandbox
[[nodiscard]] ExecutionResult assemble_result(
    const SandboxHandle& handle, IoChannel::Output output, const Completion& completion
);

// Record of an execution that failed because of the sandbox, not the submission
[[nodiscard]] ExecutionResult
infrastructure_error_result(std::string request_id, std::string_view message);

} // namespace execbox
