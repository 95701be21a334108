#pragma once

#include <chrono>
#include <cstdint>
#include <execbox/execution_request.hh>
#include <execbox/file_descriptor.hh>
#include <execbox/limits.hh>
#include <execbox/runtime_profile.hh>
#include <execbox/si.hh>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <sys/types.h>
#include <vector>

namespace execbox::isolation {

struct SpawnSpec {
    std::string_view request_id;
    const RuntimeProfile& profile; // NOLINT
    const LimitSet& limits; // NOLINT
    std::string_view workspace; // host path of the workspace
    std::vector<std::string> command; // program and its arguments (without the entrypoint)
    // Variables requested by the caller as NAME=VALUE, the backend adds its base environment
    std::vector<std::string> env;
    int stdin_fd;
    int stdout_fd;
    int stderr_fd;
};

struct SpawnedProcess {
    pid_t pid = -1; // direct child of the current process, leader of its own process group
    FileDescriptor pidfd; // becomes readable once the process exits
    std::string isolation_id; // backend-specific e.g. cgroup path or container name
    std::shared_ptr<void> backend_state; // backend-specific, may be null
};

struct ReapResult {
    Si si;
    std::optional<std::chrono::microseconds> cpu_time;
    std::optional<uint64_t> peak_memory_bytes;
};

// Host isolation primitives. All methods throw std::runtime_error (or InfrastructureFault) on
// failure.
// NOLINTNEXTLINE(cppcoreguidelines-special-member-functions)
class IsolationBackend {
public:
    virtual ~IsolationBackend() = default;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;

    // Creates an empty workspace accessible by the profile's identity, returns its host path
    [[nodiscard]] virtual std::string
    create_workspace(std::string_view request_id, const RuntimeProfile& profile) = 0;

    // Writes @p file into the workspace (creating the missing parent directories)
    virtual void write_file(
        const std::string& workspace, const SourceFile& file, const RuntimeProfile& profile
    ) = 0;

    // Launches the process under the limits. The process leads its own process group.
    [[nodiscard]] virtual SpawnedProcess spawn(const SpawnSpec& spec) = 0;

    // Sends @p signo to the whole process group of the sandboxed process
    virtual void signal_group(const SpawnedProcess& process, int signo) = 0;

    // Forcibly terminates every process of the sandbox. Must be called before reap(), so that
    // the process group cannot be reused.
    virtual void kill_group(const SpawnedProcess& process) = 0;

    // Waits for the (already exited or killed) process and returns its status
    [[nodiscard]] virtual ReapResult reap(SpawnedProcess& process) = 0;

    // Frees what spawn() allocated besides the process e.g. the cgroup or the container
    virtual void release_process(const SpawnedProcess& process) = 0;

    // Recursively removes the workspace, removing an absent workspace is not an error
    virtual void remove_workspace(const std::string& workspace) = 0;
};

} // namespace execbox::isolation
