#include <execbox/result_assembler.hh>

namespace execbox {

SandboxState classify_termination(
    const Si& si, std::optional<SandboxState> termination_cause, bool termination_signal_sent
) noexcept {
    if (termination_cause and termination_signal_sent) {
        return *termination_cause;
    }
    if (si.exit_code()) {
        return SandboxState::COMPLETED;
    }
    return SandboxState::SIGNALED;
}

ExecutionResult assemble_result(
    const SandboxHandle& handle, IoChannel::Output output, const Completion& completion
) {
    auto classification = [&] {
        switch (classify_termination(
            completion.si, completion.termination_cause, completion.termination_signal_sent
        )) {
        case SandboxState::TIMED_OUT: return Classification::TIMED_OUT;
        case SandboxState::CANCELLED: return Classification::CANCELLED;
        case SandboxState::SIGNALED: return Classification::SIGNALED;
        case SandboxState::COMPLETED:
        case SandboxState::CREATED:
        case SandboxState::RUNNING:
        case SandboxState::FAULTED:
        case SandboxState::DESTROYED: break;
        }
        return Classification::COMPLETED;
    }();

    return ExecutionResult{
        .request_id = handle.request_id(),
        .classification = classification,
        .exit_code = completion.si.exit_code(),
        .signal = completion.si.killing_signal(),
        .status_description = completion.si.description(),
        .stdout_stream = std::move(output.stdout_stream),
        .stderr_stream = std::move(output.stderr_stream),
        .combined_stream = std::move(output.combined_stream),
        .wall_time = std::chrono::duration_cast<std::chrono::milliseconds>(completion.wall_time),
        .cpu_time = completion.cpu_time,
        .peak_memory_bytes = completion.peak_memory_bytes,
    };
}

ExecutionResult infrastructure_error_result(std::string request_id, std::string_view message) {
    return ExecutionResult{
        .request_id = std::move(request_id),
        .classification = Classification::INFRASTRUCTURE_ERROR,
        .exit_code = std::nullopt,
        .signal = std::nullopt,
        .status_description = std::string{message},
        .stdout_stream = {},
        .stderr_stream = {},
        .combined_stream = std::nullopt,
        .wall_time = std::chrono::milliseconds{0},
        .cpu_time = std::nullopt,
        .peak_memory_bytes = std::nullopt,
    };
}

} // namespace execbox
