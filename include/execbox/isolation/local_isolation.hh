#pragma once

#include <execbox/isolation/isolation_backend.hh>
#include <optional>
#include <string>

namespace execbox::isolation {

// Runs sandboxes as child processes of the current process, isolated with a process group,
// resource limits, a seccomp filter, an optional cgroup v2 and (if the kernel allows it) user,
// PID and mount namespaces. In the namespaces a sandbox sees only its own processes and its own
// workspace, and pid1 of the namespace reaps the orphans.
class LocalIsolation : public IsolationBackend {
public:
    struct Options {
        std::string workspace_root;
        // Existing cgroup v2 directory delegated to us, empty means cgroups are not used
        std::string cgroup_parent = {};
        bool require_workspace_isolation = false;
    };

private:
    Options opts_;
    bool uses_namespaces_;

public:
    // Throws InfrastructureFault if the workspace root is unusable or workspace isolation is
    // required but unsupported
    explicit LocalIsolation(Options opts);

    [[nodiscard]] std::string_view name() const noexcept override { return "local"; }

    // Whether the sandboxed processes see only their own processes and their own workspace
    // under workspace_root
    [[nodiscard]] bool isolates_sandboxes() const noexcept { return uses_namespaces_; }

    [[nodiscard]] std::string
    create_workspace(std::string_view request_id, const RuntimeProfile& profile) override;

    void write_file(
        const std::string& workspace, const SourceFile& file, const RuntimeProfile& profile
    ) override;

    [[nodiscard]] SpawnedProcess spawn(const SpawnSpec& spec) override;

    void signal_group(const SpawnedProcess& process, int signo) override;

    void kill_group(const SpawnedProcess& process) override;

    [[nodiscard]] ReapResult reap(SpawnedProcess& process) override;

    void release_process(const SpawnedProcess& process) override;

    void remove_workspace(const std::string& workspace) override;
};

// Waits for the child @p pid with waitid(), retrying on EINTR
[[nodiscard]] ReapResult wait_for_child(pid_t pid);

} // namespace execbox::isolation
