#pragma once

#include <execbox/isolation/isolation_backend.hh>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

namespace execbox::isolation {

// Runs every sandbox in its own container through the docker CLI. The spawned process is the
// "docker run" client attached to the container's standard streams.
class ContainerIsolation : public IsolationBackend {
public:
    struct Options {
        std::string workspace_root;
        std::string docker_binary = "docker";
    };

private:
    Options opts_;

    // Output containing any of @p ignored_errors is not a failure
    void run_docker(
        std::vector<std::string> args, std::initializer_list<std::string_view> ignored_errors
    );

public:
    // Throws InfrastructureFault if the workspace root is unusable
    explicit ContainerIsolation(Options opts);

    [[nodiscard]] std::string_view name() const noexcept override { return "container"; }

    /**
     * @brief Builds the command line that runs the sandbox as container @p container_name with
     *   the host workspace @p spec.workspace mounted at the profile's workspace path
     */
    [[nodiscard]] static std::vector<std::string> docker_run_argv(
        const std::string& docker_binary, const std::string& container_name, const SpawnSpec& spec
    );

    [[nodiscard]] std::string
    create_workspace(std::string_view request_id, const RuntimeProfile& profile) override;

    void write_file(
        const std::string& workspace, const SourceFile& file, const RuntimeProfile& profile
    ) override;

    [[nodiscard]] SpawnedProcess spawn(const SpawnSpec& spec) override;

    void signal_group(const SpawnedProcess& process, int signo) override;

    void kill_group(const SpawnedProcess& process) override;

    // docker run exits with 125 if the container could not be started, this is reported as
    // InfrastructureFault. Exit codes 129-192 mean that the container was killed by a signal.
    [[nodiscard]] ReapResult reap(SpawnedProcess& process) override;

    void release_process(const SpawnedProcess& process) override;

    void remove_workspace(const std::string& workspace) override;
};

} // namespace execbox::isolation
