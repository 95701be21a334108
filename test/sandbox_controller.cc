#include "gtest_with_tester.hh"
#include "sandbox_utils.hh"

#include <csignal>
#include <execbox/cancellation.hh>
#include <execbox/concat_tostr.hh>
#include <execbox/errors.hh>
#include <execbox/isolation/local_isolation.hh>
#include <execbox/result_assembler.hh>
#include <execbox/sandbox_controller.hh>
#include <execbox/temporary_directory.hh>
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <sys/stat.h>
#include <sys/wait.h>
#include <thread>
#include <vector>

using execbox::CancellationToken;
using execbox::Classification;
using execbox::Completion;
using execbox::ExecutionRequest;
using execbox::InfrastructureFault;
using execbox::IoChannel;
using execbox::LimitSet;
using execbox::NetworkPolicy;
using execbox::RuntimeProfile;
using execbox::SandboxController;
using execbox::SandboxHandle;
using execbox::SandboxState;
using execbox::Si;
using execbox::isolation::LocalIsolation;
using std::string;
using std::vector;
using std::chrono::milliseconds;
using std::chrono::steady_clock;

namespace {

struct Setup {
    TemporaryDirectory tmp_dir{"/tmp/execbox-test.XXXXXX"};
    LocalIsolation backend{{.workspace_root = tmp_dir.path()}};
    SandboxController controller;

    explicit Setup(milliseconds grace_period = milliseconds{500})
    : controller{
          backend,
          {
              .grace_period = grace_period,
              .destroy_attempts = 3,
              .output_drain_timeout = milliseconds{1000},
          }
      } {}
};

struct Run {
    Completion completion;
    IoChannel::Output output;
    pid_t pid;
    string workspace;
    milliseconds elapsed;
};

// Runs "/bin/sh -c @p script" through the whole lifecycle
Run run(
    SandboxController& controller,
    const RuntimeProfile& profile,
    ExecutionRequest req,
    const LimitSet& limits = test_limits(),
    const CancellationToken* cancellation = nullptr
) {
    auto start = steady_clock::now();
    auto handle = controller.create(profile, limits, req);
    controller.start(handle);
    auto completion = controller.await_completion(handle, cancellation);
    Run res = {
        .completion = completion,
        .output = handle.take_output(),
        .pid = handle.pid(),
        .workspace = handle.workspace(),
        .elapsed = std::chrono::duration_cast<milliseconds>(steady_clock::now() - start),
    };
    controller.destroy(handle);
    EXPECT_EQ(handle.state(), SandboxState::DESTROYED);
    return res;
}

ExecutionRequest shell_request(string script, std::optional<string> stdin_data = std::nullopt) {
    return {
        .id = "",
        .language = "shell",
        .files = {{.path = "main.sh", .content = script}},
        .stdin_data = std::move(stdin_data),
        .timeout = std::nullopt,
        .arguments = {std::move(script)},
    };
}

RuntimeProfile tester_profile() {
    auto profile = shell_profile();
    profile.command = {string{tester_executable_path}};
    return profile;
}

ExecutionRequest tester_request(vector<string> args) {
    return {
        .id = "",
        .language = "shell",
        .files = {{.path = "main.sh", .content = ""}},
        .stdin_data = std::nullopt,
        .timeout = std::nullopt,
        .arguments = std::move(args),
    };
}

} // namespace

#define EXPECT_TESTER_PASSED(run_res)                                        \
    EXPECT_EQ((run_res).completion.si, (Si{.code = CLD_EXITED, .status = 0})) \
        << (run_res).completion.si.description() << "\nstderr:\n"            \
        << (run_res).output.stderr_stream.data

// NOLINTNEXTLINE
TEST(sandbox_controller, exit_code_is_reported) {
    ::Setup s;
    auto res = run(s.controller, shell_profile(), shell_request("exit 7"));
    EXPECT_EQ(res.completion.state, SandboxState::COMPLETED);
    EXPECT_EQ(res.completion.si, (Si{.code = CLD_EXITED, .status = 7}));
    EXPECT_FALSE(res.completion.termination_cause.has_value());
    EXPECT_FALSE(res.completion.termination_signal_sent);
    EXPECT_EQ(res.output.stdout_stream.data, "");
    EXPECT_EQ(res.output.stderr_stream.data, "");
    EXPECT_TRUE(res.completion.cpu_time.has_value());
    EXPECT_TRUE(res.completion.peak_memory_bytes.has_value());
    EXPECT_FALSE(exists(res.workspace));
    EXPECT_TRUE(wait_until_process_group_is_gone(res.pid));
}

// NOLINTNEXTLINE
TEST(sandbox_controller, assembled_result) {
    ::Setup s;
    auto profile = shell_profile();
    auto req = shell_request("echo out; echo err >&2; exit 3");
    req.id = "assembled";
    req.capture_combined = true;
    auto handle = s.controller.create(profile, test_limits(), req);
    EXPECT_EQ(handle.state(), SandboxState::CREATED);
    EXPECT_EQ(handle.request_id(), "assembled");
    EXPECT_EQ(handle.workspace(), s.tmp_dir.path() + "execbox-assembled");
    s.controller.start(handle);
    EXPECT_EQ(handle.state(), SandboxState::RUNNING);
    auto completion = s.controller.await_completion(handle);
    EXPECT_EQ(handle.state(), SandboxState::COMPLETED);

    auto result = execbox::assemble_result(handle, handle.take_output(), completion);
    s.controller.destroy(handle);
    EXPECT_EQ(result.request_id, "assembled");
    EXPECT_EQ(result.classification, Classification::COMPLETED);
    EXPECT_EQ(result.exit_code, 3);
    EXPECT_EQ(result.signal, std::nullopt);
    EXPECT_EQ(result.status_description, "exited with 3");
    EXPECT_EQ(result.stdout_stream.data, "out\n");
    EXPECT_EQ(result.stderr_stream.data, "err\n");
    ASSERT_TRUE(result.combined_stream.has_value());
    EXPECT_EQ(result.combined_stream->total_bytes, 8);
    EXPECT_LT(result.wall_time, milliseconds{5000});
}

// NOLINTNEXTLINE
TEST(sandbox_controller, request_id_is_generated_if_empty) {
    ::Setup s;
    auto handle = s.controller.create(shell_profile(), test_limits(), shell_request("true"));
    EXPECT_EQ(handle.request_id().size(), 32);
    EXPECT_TRUE(exists(handle.workspace()));
    EXPECT_TRUE(exists(handle.workspace() + "/main.sh"));
}

// NOLINTNEXTLINE
TEST(sandbox_controller, arguments_and_environment) {
    ::Setup s;
    auto req = shell_request(R"x(echo "$1|$2|$FOO|$HOME|$LANG|$(pwd)|$(cat main.sh | wc -c)")x");
    req.arguments.insert(req.arguments.end(), {"name", "first arg", "second arg"});
    req.environment = {{"FOO", "bar baz"}};
    auto handle = s.controller.create(shell_profile(), test_limits(), req);
    auto workspace = handle.workspace();
    s.controller.start(handle);
    (void)s.controller.await_completion(handle);
    auto output = handle.take_output();
    auto expected = concat_tostr(
        "first arg|second arg|bar baz|",
        workspace,
        "|C.UTF-8|",
        workspace,
        '|',
        req.files[0].content.size(),
        '\n'
    );
    EXPECT_EQ(output.stdout_stream.data, expected) << output.stderr_stream.data;
}

// NOLINTNEXTLINE
TEST(sandbox_controller, large_stdin_is_echoed) {
    ::Setup s;
    string input;
    for (int i = 0; input.size() < (2 << 20); ++i) {
        input += concat_tostr(i, '\n');
    }
    auto limits = test_limits();
    limits.max_output_bytes = 4 << 20;
    auto res = run(s.controller, shell_profile(), shell_request("cat", input), limits);
    EXPECT_EQ(res.completion.state, SandboxState::COMPLETED);
    EXPECT_EQ(res.output.stdout_stream.total_bytes, input.size());
    EXPECT_TRUE(res.output.stdout_stream.data == input);
}

// NOLINTNEXTLINE
TEST(sandbox_controller, output_is_truncated_at_the_cap) {
    ::Setup s;
    auto limits = test_limits();
    limits.max_output_bytes = 1000;
    auto res = run(
        s.controller,
        shell_profile(),
        shell_request("head -c 100000 /dev/zero; head -c 10 /dev/zero >&2"),
        limits
    );
    EXPECT_EQ(res.completion.state, SandboxState::COMPLETED);
    EXPECT_EQ(res.output.stdout_stream.data, string(1000, '\0'));
    EXPECT_EQ(res.output.stdout_stream.total_bytes, 100000);
    EXPECT_TRUE(res.output.stdout_stream.truncated());
    EXPECT_EQ(res.output.stderr_stream.data, string(10, '\0'));
    EXPECT_FALSE(res.output.stderr_stream.truncated());
}

// NOLINTNEXTLINE
TEST(sandbox_controller, timeout_terminates_the_process_group) {
    ::Setup s;
    auto limits = test_limits();
    limits.wall_time = milliseconds{300};
    auto res = run(s.controller, shell_profile(), shell_request("sleep 100 & sleep 100"), limits);
    EXPECT_EQ(res.completion.state, SandboxState::TIMED_OUT);
    EXPECT_EQ(res.completion.termination_cause, SandboxState::TIMED_OUT);
    EXPECT_TRUE(res.completion.termination_signal_sent);
    EXPECT_EQ(res.completion.si, (Si{.code = CLD_KILLED, .status = SIGTERM}))
        << res.completion.si.description();
    EXPECT_GE(res.completion.wall_time, milliseconds{300});
    EXPECT_LT(res.elapsed, milliseconds{5000});
    EXPECT_TRUE(wait_until_process_group_is_gone(res.pid));
}

// NOLINTNEXTLINE
TEST(sandbox_controller, process_ignoring_sigterm_is_killed_after_grace_period) {
    ::Setup s{milliseconds{500}};
    auto limits = test_limits();
    limits.wall_time = milliseconds{200};
    auto res = run(
        s.controller,
        shell_profile(),
        shell_request("trap '' TERM; echo ready; while :; do sleep 0.05; done"),
        limits
    );
    EXPECT_EQ(res.completion.state, SandboxState::TIMED_OUT);
    EXPECT_EQ(res.completion.si, (Si{.code = CLD_KILLED, .status = SIGKILL}))
        << res.completion.si.description();
    EXPECT_GE(res.completion.wall_time, milliseconds{700});
    EXPECT_LT(res.elapsed, milliseconds{5000});
    EXPECT_EQ(res.output.stdout_stream.data, "ready\n");
    EXPECT_TRUE(wait_until_process_group_is_gone(res.pid));
}

// NOLINTNEXTLINE
TEST(sandbox_controller, no_grace_period_without_signal_forwarding) {
    ::Setup s{milliseconds{60'000}};
    auto limits = test_limits();
    limits.wall_time = milliseconds{200};
    auto res = run(s.controller, shell_profile(false), shell_request("sleep 100"), limits);
    EXPECT_EQ(res.completion.state, SandboxState::TIMED_OUT);
    EXPECT_EQ(res.completion.si, (Si{.code = CLD_KILLED, .status = SIGKILL}));
    EXPECT_LT(res.elapsed, milliseconds{5000});
}

// NOLINTNEXTLINE
TEST(sandbox_controller, cancellation) {
    ::Setup s;
    CancellationToken token;
    std::thread canceller{[&] {
        std::this_thread::sleep_for(milliseconds{200});
        token.cancel();
    }};
    auto res =
        run(s.controller, shell_profile(), shell_request("sleep 100"), test_limits(), &token);
    canceller.join();
    EXPECT_EQ(res.completion.state, SandboxState::CANCELLED);
    EXPECT_EQ(res.completion.termination_cause, SandboxState::CANCELLED);
    EXPECT_LT(res.elapsed, milliseconds{5000});
    EXPECT_TRUE(wait_until_process_group_is_gone(res.pid));
}

// NOLINTNEXTLINE
TEST(sandbox_controller, cancelled_before_start) {
    ::Setup s;
    CancellationToken token;
    token.cancel();
    auto res =
        run(s.controller, shell_profile(), shell_request("sleep 100"), test_limits(), &token);
    EXPECT_EQ(res.completion.state, SandboxState::CANCELLED);
    EXPECT_LT(res.elapsed, milliseconds{5000});
}

// NOLINTNEXTLINE
TEST(sandbox_controller, background_processes_do_not_outlive_the_sandbox) {
    ::Setup s;
    auto res = run(s.controller, shell_profile(), shell_request("sleep 100 & echo started"));
    EXPECT_EQ(res.completion.state, SandboxState::COMPLETED);
    EXPECT_EQ(res.completion.si, (Si{.code = CLD_EXITED, .status = 0}));
    EXPECT_EQ(res.output.stdout_stream.data, "started\n");
    EXPECT_LT(res.elapsed, milliseconds{5000});
    EXPECT_TRUE(wait_until_process_group_is_gone(res.pid));
}

// NOLINTNEXTLINE
TEST(sandbox_controller, killed_by_signal) {
    ::Setup s;
    auto res = run(s.controller, shell_profile(), shell_request("kill -SEGV $$"));
    EXPECT_EQ(res.completion.state, SandboxState::SIGNALED);
    EXPECT_EQ(res.completion.si.status, SIGSEGV);
    EXPECT_TRUE(res.completion.si.code == CLD_KILLED or res.completion.si.code == CLD_DUMPED);
}

// NOLINTNEXTLINE
TEST(sandbox_controller, concurrent_sandboxes_cannot_see_or_kill_each_other) {
    ::Setup s;
    if (not s.backend.isolates_sandboxes()) {
        GTEST_SKIP() << "creating user, PID and mount namespaces is not permitted";
    }
    auto victim_req = shell_request("sleep 2");
    victim_req.id = "victim";
    victim_req.files.push_back({.path = "secret.txt", .content = "TOPSECRET-victim"});
    auto victim = s.controller.create(shell_profile(), test_limits(), victim_req);
    s.controller.start(victim);

    const auto& root = s.tmp_dir.path();
    auto attacker_req = shell_request(concat_tostr(
        "ls -a '", root, "'; cat /proc/[0-9]*/cwd/secret.txt; kill -9 -1; touch ../escaped"
    ));
    attacker_req.id = "attacker";
    auto attacker = run(s.controller, shell_profile(), attacker_req);
    EXPECT_EQ(attacker.output.stdout_stream.data, ".\n..\nexecbox-attacker\n")
        << attacker.output.stderr_stream.data;
    // Writes outside the workspace go to the sandbox's private tmpfs
    EXPECT_FALSE(exists(root + "escaped"));

    auto victim_completion = s.controller.await_completion(victim);
    EXPECT_EQ(victim_completion.state, SandboxState::COMPLETED);
    EXPECT_EQ(victim_completion.si, (Si{.code = CLD_EXITED, .status = 0}));
    s.controller.destroy(victim);
    EXPECT_EQ(victim.state(), SandboxState::DESTROYED);
}

// NOLINTNEXTLINE
TEST(sandbox_controller, program_runs_under_its_own_pid1) {
    ::Setup s;
    if (not s.backend.isolates_sandboxes()) {
        GTEST_SKIP() << "creating user, PID and mount namespaces is not permitted";
    }
    auto res = run(s.controller, shell_profile(), shell_request("echo $$; exit 3"));
    EXPECT_EQ(res.completion.state, SandboxState::COMPLETED);
    // The exit status is the program's, not pid1's
    EXPECT_EQ(res.completion.si, (Si{.code = CLD_EXITED, .status = 3}));
    EXPECT_EQ(res.output.stdout_stream.data, "2\n");
}

// NOLINTNEXTLINE
TEST(sandbox_controller, process_cannot_leave_its_process_group) {
    ::Setup s;
    auto res = run(s.controller, tester_profile(), tester_request({"no_new_session"}));
    EXPECT_TESTER_PASSED(res);
}

// NOLINTNEXTLINE
TEST(sandbox_controller, network_denied) {
    ::Setup s;
    auto res = run(s.controller, tester_profile(), tester_request({"network_denied"}));
    EXPECT_TESTER_PASSED(res);
}

// NOLINTNEXTLINE
TEST(sandbox_controller, io_uring_denied) {
    ::Setup s;
    auto res = run(s.controller, tester_profile(), tester_request({"io_uring_denied"}));
    EXPECT_TESTER_PASSED(res);
}

// NOLINTNEXTLINE
TEST(sandbox_controller, network_allowed) {
    ::Setup s;
    auto limits = test_limits();
    limits.network = NetworkPolicy::ALLOWED;
    auto res = run(s.controller, tester_profile(), tester_request({"network_allowed"}), limits);
    EXPECT_TESTER_PASSED(res);
}

// NOLINTNEXTLINE
TEST(sandbox_controller, write_quota) {
    ::Setup s;
    auto limits = test_limits();
    limits.write_quota_bytes = 4096;
    auto res = run(s.controller, tester_profile(), tester_request({"file_size", "4096"}), limits);
    EXPECT_TESTER_PASSED(res);
}

// NOLINTNEXTLINE
TEST(sandbox_controller, memory_limit) {
    ::Setup s;
    auto limits = test_limits();
    limits.memory_bytes = 256 << 20;
    auto res = run(
        s.controller,
        tester_profile(),
        tester_request({"memory", concat_tostr(limits.memory_bytes)}),
        limits
    );
    EXPECT_TESTER_PASSED(res);
}

// NOLINTNEXTLINE
TEST(sandbox_controller, process_limit_stops_fork_bomb) {
    ::Setup s;
    // Without a user namespace RLIMIT_NPROC counts all processes of the user
    if (not s.backend.isolates_sandboxes()) {
        GTEST_SKIP() << "the process limit cannot be enforced without a cgroup";
    }
    auto limits = test_limits();
    limits.max_processes = 16;
    auto res = run(s.controller, tester_profile(), tester_request({"fork_bomb", "16"}), limits);
    EXPECT_TESTER_PASSED(res);
    EXPECT_TRUE(wait_until_process_group_is_gone(res.pid));
}

// NOLINTNEXTLINE
TEST(sandbox_controller, destroy_removes_directories_without_permissions) {
    ::Setup s;
    auto res = run(
        s.controller,
        shell_profile(),
        shell_request("mkdir -p locked/nested && touch locked/nested/f && chmod 000 locked/nested "
                      "locked && mkdir read_only && touch read_only/f && chmod 500 read_only")
    );
    EXPECT_EQ(res.completion.si, (Si{.code = CLD_EXITED, .status = 0}))
        << res.output.stderr_stream.data;
    EXPECT_FALSE(exists(res.workspace));
}

// NOLINTNEXTLINE
TEST(sandbox_controller, destroy_is_idempotent) {
    ::Setup s;
    auto handle = s.controller.create(shell_profile(), test_limits(), shell_request("true"));
    auto workspace = handle.workspace();
    ASSERT_TRUE(exists(workspace));
    s.controller.destroy(handle);
    EXPECT_EQ(handle.state(), SandboxState::DESTROYED);
    EXPECT_FALSE(exists(workspace));
    s.controller.destroy(handle);
    EXPECT_EQ(handle.state(), SandboxState::DESTROYED);
    EXPECT_THROW((void)handle.take_output(), std::logic_error);
}

// NOLINTNEXTLINE
TEST(sandbox_controller, running_sandbox_is_destroyed_by_handle_destructor) {
    ::Setup s;
    string workspace;
    pid_t pid = -1;
    {
        auto handle =
            s.controller.create(shell_profile(), test_limits(), shell_request("sleep 100"));
        s.controller.start(handle);
        workspace = handle.workspace();
        pid = handle.pid();
    }
    EXPECT_FALSE(exists(workspace));
    EXPECT_TRUE(wait_until_process_group_is_gone(pid));
}

// NOLINTNEXTLINE
TEST(sandbox_controller, move_assignment_destroys_the_previous_sandbox) {
    ::Setup s;
    auto first = s.controller.create(shell_profile(), test_limits(), shell_request("true"));
    auto second = s.controller.create(shell_profile(), test_limits(), shell_request("true"));
    auto first_workspace = first.workspace();
    auto second_workspace = second.workspace();
    first = std::move(second);
    EXPECT_FALSE(exists(first_workspace));
    EXPECT_TRUE(exists(second_workspace));
    EXPECT_EQ(first.workspace(), second_workspace);
}

// NOLINTNEXTLINE
TEST(sandbox_controller, wrong_state_transitions_are_logic_errors) {
    ::Setup s;
    auto handle = s.controller.create(shell_profile(), test_limits(), shell_request("true"));
    EXPECT_THROW((void)s.controller.await_completion(handle), std::logic_error);
    s.controller.start(handle);
    EXPECT_THROW(s.controller.start(handle), std::logic_error);
    (void)s.controller.await_completion(handle);
    EXPECT_THROW((void)s.controller.await_completion(handle), std::logic_error);
    s.controller.destroy(handle);
    EXPECT_THROW(s.controller.start(handle), std::logic_error);
}

// NOLINTNEXTLINE
TEST(sandbox_controller, spawn_failure_destroys_the_sandbox) {
    ::Setup s;
    auto profile = shell_profile();
    profile.command = {"/nonexistent/interpreter"};
    auto handle = s.controller.create(profile, test_limits(), shell_request("true"));
    auto workspace = handle.workspace();
    EXPECT_THROW(s.controller.start(handle), InfrastructureFault);
    EXPECT_EQ(handle.state(), SandboxState::DESTROYED);
    EXPECT_FALSE(exists(workspace));
}

// NOLINTNEXTLINE
TEST(sandbox_controller, invalid_file_path_fails_creation) {
    ::Setup s;
    auto req = shell_request("true");
    req.id = "bad-file";
    req.files.push_back({.path = "main.sh/inner", .content = ""});
    EXPECT_THROW(
        (void)s.controller.create(shell_profile(), test_limits(), req), InfrastructureFault
    );
    EXPECT_FALSE(exists(s.tmp_dir.path() + "execbox-bad-file"));
}

// NOLINTNEXTLINE
TEST(sandbox_controller, concurrent_sandboxes) {
    ::Setup s;
    constexpr int threads_num = 4;
    std::vector<std::thread> threads;
    std::vector<string> outputs(threads_num);
    for (int i = 0; i < threads_num; ++i) {
        threads.emplace_back([&, i] {
            auto res = run(
                s.controller, shell_profile(), shell_request(concat_tostr("sleep 0.1; echo ", i))
            );
            outputs[i] = res.output.stdout_stream.data;
        });
    }
    for (auto& th : threads) {
        th.join();
    }
    for (int i = 0; i < threads_num; ++i) {
        EXPECT_EQ(outputs[i], concat_tostr(i, '\n'));
    }
}
