#include "intercept_logger.hh"
#include "sandbox_utils.hh"

#include <csignal>
#include <execbox/errors.hh>
#include <execbox/isolation/local_isolation.hh>
#include <execbox/logger.hh>
#include <execbox/resource_accountant.hh>
#include <execbox/sandbox_controller.hh>
#include <execbox/temporary_directory.hh>
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>

using execbox::ExecutionRequest;
using execbox::InfrastructureFault;
using execbox::ResourceAccountant;
using execbox::RuntimeProfile;
using execbox::SandboxController;
using execbox::SandboxState;
using execbox::SourceFile;
using execbox::isolation::IsolationBackend;
using execbox::isolation::LocalIsolation;
using execbox::isolation::ReapResult;
using execbox::isolation::SpawnedProcess;
using execbox::isolation::SpawnSpec;
using std::string;
using std::chrono::milliseconds;

namespace {

// Local isolation that fails the chosen steps a given number of times and counts the calls
class FaultyBackend : public IsolationBackend {
public:
    struct Step {
        int fail_times = 0;
        int calls = 0;

        void call(const char* name) {
            ++calls;
            if (fail_times > 0) {
                --fail_times;
                throw std::runtime_error(concat_tostr("injected ", name, " failure"));
            }
        }
    };

    LocalIsolation local;
    Step create_workspace_step;
    Step write_file_step;
    Step spawn_step;
    Step signal_group_step;
    Step kill_group_step;
    Step reap_step;
    Step release_process_step;
    Step remove_workspace_step;

    explicit FaultyBackend(const string& workspace_root)
    : local{{.workspace_root = workspace_root}} {}

    [[nodiscard]] std::string_view name() const noexcept override { return "faulty"; }

    [[nodiscard]] string
    create_workspace(std::string_view request_id, const RuntimeProfile& profile) override {
        create_workspace_step.call("create_workspace");
        return local.create_workspace(request_id, profile);
    }

    void write_file(
        const string& workspace, const SourceFile& file, const RuntimeProfile& profile
    ) override {
        write_file_step.call("write_file");
        local.write_file(workspace, file, profile);
    }

    [[nodiscard]] SpawnedProcess spawn(const SpawnSpec& spec) override {
        spawn_step.call("spawn");
        return local.spawn(spec);
    }

    void signal_group(const SpawnedProcess& process, int signo) override {
        signal_group_step.call("signal_group");
        local.signal_group(process, signo);
    }

    void kill_group(const SpawnedProcess& process) override {
        kill_group_step.call("kill_group");
        local.kill_group(process);
    }

    [[nodiscard]] ReapResult reap(SpawnedProcess& process) override {
        reap_step.call("reap");
        return local.reap(process);
    }

    void release_process(const SpawnedProcess& process) override {
        release_process_step.call("release_process");
        local.release_process(process);
    }

    void remove_workspace(const string& workspace) override {
        remove_workspace_step.call("remove_workspace");
        local.remove_workspace(workspace);
    }
};

struct Setup {
    TemporaryDirectory tmp_dir{"/tmp/execbox-test.XXXXXX"};
    FaultyBackend backend{tmp_dir.path()};
    SandboxController controller{
        backend,
        {
            .grace_period = milliseconds{200},
            .destroy_attempts = 3,
            .output_drain_timeout = milliseconds{500},
        },
    };
    ResourceAccountant accountant{4, 0};
};

ExecutionRequest request(string script) {
    return {
        .id = "faulty",
        .language = "shell",
        .files = {{.path = "main.sh", .content = script}, {.path = "b.sh", .content = ""}},
        .stdin_data = std::nullopt,
        .timeout = std::nullopt,
        .arguments = {std::move(script)},
    };
}

} // namespace

// NOLINTNEXTLINE
TEST(sandbox_controller_faults, create_workspace_failure) {
    ::Setup s;
    s.backend.create_workspace_step.fail_times = 1;
    auto log = intercept_logger(errlog, [&] {
        EXPECT_THROW(
            (void)s.controller.create(
                shell_profile(), test_limits(), request("true"), s.accountant.reserve(100)
            ),
            InfrastructureFault
        );
    });
    // Nothing was created, so nothing is removed
    EXPECT_EQ(s.backend.remove_workspace_step.calls, 0);
    EXPECT_EQ(s.backend.kill_group_step.calls, 0);
    EXPECT_EQ(s.accountant.usage().active_executions, 0);
    EXPECT_EQ(s.accountant.usage().reserved_memory_bytes, 0);
    EXPECT_EQ(log, "");
}

// NOLINTNEXTLINE
TEST(sandbox_controller_faults, write_file_failure_removes_the_workspace) {
    ::Setup s;
    s.backend.write_file_step.fail_times = 1;
    try {
        (void)s.controller.create(
            shell_profile(), test_limits(), request("true"), s.accountant.reserve(100)
        );
        FAIL() << "expected InfrastructureFault";
    } catch (const InfrastructureFault& e) {
        EXPECT_NE(string{e.what()}.find("injected write_file failure"), string::npos) << e.what();
        EXPECT_NE(string{e.what()}.find("creating sandbox faulty failed"), string::npos)
            << e.what();
    }
    EXPECT_EQ(s.backend.remove_workspace_step.calls, 1);
    EXPECT_FALSE(exists(s.tmp_dir.path() + "execbox-faulty"));
    EXPECT_EQ(s.accountant.usage().active_executions, 0);
}

// NOLINTNEXTLINE
TEST(sandbox_controller_faults, spawn_failure_destroys_exactly_once) {
    ::Setup s;
    s.backend.spawn_step.fail_times = 1;
    {
        auto handle = s.controller.create(
            shell_profile(), test_limits(), request("true"), s.accountant.reserve(100)
        );
        EXPECT_THROW(s.controller.start(handle), InfrastructureFault);
        EXPECT_EQ(handle.state(), SandboxState::DESTROYED);
        EXPECT_EQ(s.accountant.usage().active_executions, 0);
    }
    // The handle's destructor does not destroy the sandbox again
    EXPECT_EQ(s.backend.remove_workspace_step.calls, 1);
    // The process was never spawned
    EXPECT_EQ(s.backend.kill_group_step.calls, 0);
    EXPECT_EQ(s.backend.reap_step.calls, 0);
    EXPECT_EQ(s.backend.release_process_step.calls, 0);
}

// NOLINTNEXTLINE
TEST(sandbox_controller_faults, signal_failure_during_timeout_still_reaps) {
    ::Setup s;
    s.backend.signal_group_step.fail_times = 1;
    auto limits = test_limits();
    limits.wall_time = milliseconds{100};
    auto handle = s.controller.create(shell_profile(), limits, request("sleep 100"));
    s.controller.start(handle);
    auto pid = handle.pid();
    EXPECT_THROW((void)s.controller.await_completion(handle), InfrastructureFault);
    EXPECT_EQ(handle.state(), SandboxState::DESTROYED);
    EXPECT_EQ(s.backend.reap_step.calls, 1);
    EXPECT_GE(s.backend.kill_group_step.calls, 1);
    EXPECT_TRUE(wait_until_process_group_is_gone(pid));
    EXPECT_FALSE(exists(s.tmp_dir.path() + "execbox-faulty"));
}

// NOLINTNEXTLINE
TEST(sandbox_controller_faults, transient_destroy_failure_is_retried) {
    ::Setup s;
    s.backend.remove_workspace_step.fail_times = 1;
    auto handle = s.controller.create(shell_profile(), test_limits(), request("true"));
    s.controller.start(handle);
    (void)s.controller.await_completion(handle);
    auto log = intercept_logger(errlog, [&] { s.controller.destroy(handle); });
    EXPECT_EQ(handle.state(), SandboxState::DESTROYED);
    EXPECT_EQ(s.backend.remove_workspace_step.calls, 2);
    EXPECT_FALSE(exists(s.tmp_dir.path() + "execbox-faulty"));
    EXPECT_NE(log.find("removing the workspace failed (attempt 1/3)"), string::npos) << log;
    EXPECT_EQ(log.find("destroyed with errors"), string::npos) << log;
}

// NOLINTNEXTLINE
TEST(sandbox_controller_faults, persistent_destroy_failure_does_not_throw) {
    ::Setup s;
    s.backend.remove_workspace_step.fail_times = 1000;
    auto handle = s.controller.create(
        shell_profile(), test_limits(), request("true"), s.accountant.reserve(100)
    );
    auto workspace = handle.workspace();
    auto log = intercept_logger(errlog, [&] { s.controller.destroy(handle); });
    EXPECT_EQ(handle.state(), SandboxState::DESTROYED);
    EXPECT_EQ(s.backend.remove_workspace_step.calls, 3);
    EXPECT_NE(log.find("(attempt 3/3)"), string::npos) << log;
    EXPECT_NE(log.find("sandbox faulty destroyed with errors"), string::npos) << log;
    // The reservation is released anyway
    EXPECT_EQ(s.accountant.usage().active_executions, 0);
    // Destroying again does not retry
    s.controller.destroy(handle);
    EXPECT_EQ(s.backend.remove_workspace_step.calls, 3);
    s.backend.local.remove_workspace(workspace);
}

// NOLINTNEXTLINE
TEST(sandbox_controller_faults, reap_failure_is_not_repeated) {
    ::Setup s;
    auto handle = s.controller.create(shell_profile(), test_limits(), request("sleep 100"));
    s.controller.start(handle);
    auto pid = handle.pid();
    s.backend.reap_step.fail_times = 1;
    (void)intercept_logger(errlog, [&] { s.controller.destroy(handle); });
    EXPECT_EQ(handle.state(), SandboxState::DESTROYED);
    // The failed attempt is retried within destroy(), but never by a later destroy()
    EXPECT_EQ(s.backend.reap_step.calls, 2);
    s.controller.destroy(handle);
    EXPECT_EQ(s.backend.reap_step.calls, 2);
    EXPECT_TRUE(wait_until_process_group_is_gone(pid));
}

// NOLINTNEXTLINE
TEST(sandbox_controller_faults, destructor_destroys_exactly_once) {
    ::Setup s;
    {
        auto handle = s.controller.create(
            shell_profile(), test_limits(), request("sleep 100"), s.accountant.reserve(100)
        );
        s.controller.start(handle);
        EXPECT_EQ(s.accountant.usage().active_executions, 1);
    }
    EXPECT_EQ(s.backend.kill_group_step.calls, 1);
    EXPECT_EQ(s.backend.reap_step.calls, 1);
    EXPECT_EQ(s.backend.release_process_step.calls, 1);
    EXPECT_EQ(s.backend.remove_workspace_step.calls, 1);
    EXPECT_EQ(s.accountant.usage().active_executions, 0);
}
