#include "intercept_logger.hh"

#include <execbox/concat_tostr.hh>
#include <execbox/file_manip.hh>
#include <execbox/logger.hh>
#include <execbox/temporary_directory.hh>
#include <execbox/workspace_sweep.hh>
#include <fcntl.h>
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <sys/stat.h>
#include <vector>

using execbox::docker_ps_argv;
using execbox::parse_docker_ps_output;
using execbox::sweep_orphaned_cgroups;
using execbox::sweep_orphaned_containers;
using execbox::sweep_orphaned_workspaces;
using std::string;
using std::chrono::seconds;

namespace {

bool exists(const string& path) {
    struct stat st = {};
    return stat(path.c_str(), &st) == 0;
}

void make_dir(const string& path) { ASSERT_EQ(mkdir(path.c_str(), 0700), 0) << path; }

void make_file(const string& path) { put_file_contents(path, "contents"); }

// Sets the modification time @p age into the past
void make_old(const string& path, seconds age) {
    timespec times[2] = {
        {.tv_sec = 0, .tv_nsec = UTIME_OMIT},
        {.tv_sec = time(nullptr) - age.count(), .tv_nsec = 0},
    };
    ASSERT_EQ(utimensat(AT_FDCWD, path.c_str(), times, AT_SYMLINK_NOFOLLOW), 0) << path;
}

// Formats like docker ps {{.CreatedAt}}, e.g. "2026-10-17 12:34:56 +0000 UTC"
string docker_time(std::chrono::system_clock::time_point tp) {
    time_t t = std::chrono::system_clock::to_time_t(tp);
    tm utc = {};
    throw_assert(gmtime_r(&t, &utc));
    char buff[64];
    throw_assert(strftime(buff, sizeof(buff), "%Y-%m-%d %H:%M:%S +0000 UTC", &utc) > 0);
    return buff;
}

} // namespace

// NOLINTNEXTLINE
TEST(workspace_sweep, removes_only_old_workspaces) {
    TemporaryDirectory tmp_dir{"/tmp/execbox-test.XXXXXX"};
    const auto& root = tmp_dir.path();

    make_dir(root + "execbox-old");
    make_dir(root + "execbox-old/nested");
    make_file(root + "execbox-old/nested/main.py");
    make_old(root + "execbox-old", seconds{3600});

    make_dir(root + "execbox-old2");
    make_old(root + "execbox-old2", seconds{7200});

    make_dir(root + "execbox-fresh");

    make_dir(root + "unrelated-old");
    make_old(root + "unrelated-old", seconds{3600});

    make_file(root + "execbox-file");
    make_old(root + "execbox-file", seconds{3600});

    size_t removed = 0;
    auto log = intercept_logger(stdlog, [&] {
        removed = sweep_orphaned_workspaces(root, seconds{1800});
    });
    EXPECT_EQ(removed, 2);
    EXPECT_FALSE(exists(root + "execbox-old"));
    EXPECT_FALSE(exists(root + "execbox-old2"));
    EXPECT_TRUE(exists(root + "execbox-fresh"));
    EXPECT_TRUE(exists(root + "unrelated-old"));
    EXPECT_TRUE(exists(root + "execbox-file"));
    EXPECT_NE(log.find("sweep: removed orphaned workspace"), string::npos) << log;

    // Nothing left to remove
    EXPECT_EQ(sweep_orphaned_workspaces(root, seconds{1800}), 0);
    // Zero age sweeps every workspace
    EXPECT_EQ(sweep_orphaned_workspaces(root, seconds{0}), 1);
    EXPECT_FALSE(exists(root + "execbox-fresh"));
}

// NOLINTNEXTLINE
TEST(workspace_sweep, unreadable_root_throws) {
    EXPECT_THROW(
        (void)sweep_orphaned_workspaces("/nonexistent/execbox/root", seconds{0}),
        std::runtime_error
    );
}

// NOLINTNEXTLINE
TEST(workspace_sweep, removes_only_old_empty_cgroups) {
    TemporaryDirectory tmp_dir{"/tmp/execbox-test.XXXXXX"};
    const auto& parent = tmp_dir.path();

    make_dir(parent + "execbox-old");
    make_old(parent + "execbox-old", seconds{3600});
    // A cgroup with processes cannot be removed, here emulated by a non-empty directory
    make_dir(parent + "execbox-busy");
    make_dir(parent + "execbox-busy/child");
    make_old(parent + "execbox-busy", seconds{3600});
    make_dir(parent + "execbox-fresh");
    make_dir(parent + "other-old");
    make_old(parent + "other-old", seconds{3600});

    size_t removed = 0;
    string log;
    auto err_log = intercept_logger(errlog, [&] {
        log = intercept_logger(stdlog, [&] {
            removed = sweep_orphaned_cgroups(parent, seconds{1800});
        });
    });
    EXPECT_EQ(removed, 1);
    EXPECT_FALSE(exists(parent + "execbox-old"));
    EXPECT_TRUE(exists(parent + "execbox-busy"));
    EXPECT_TRUE(exists(parent + "execbox-fresh"));
    EXPECT_TRUE(exists(parent + "other-old"));
    EXPECT_NE(log.find("sweep: removed orphaned cgroup"), string::npos) << log;
    EXPECT_NE(err_log.find("execbox-busy"), string::npos) << err_log;
}

// NOLINTNEXTLINE
TEST(workspace_sweep, docker_ps_argv) {
    EXPECT_EQ(
        docker_ps_argv("/usr/bin/docker"),
        (std::vector<string>{
            "/usr/bin/docker",
            "ps",
            "--all",
            "--no-trunc",
            "--filter",
            "label=execbox.request",
            "--format",
            "{{.Names}}\t{{.CreatedAt}}",
        })
    );
}

// NOLINTNEXTLINE
TEST(workspace_sweep, parse_docker_ps_output) {
    auto containers = parse_docker_ps_output("execbox-a\t2026-10-17 12:34:56 +0000 UTC\n"
                                             "\n"
                                             "execbox-b\t2026-10-17 14:34:56 +0200 CEST\n"
                                             "execbox-c\t2026-10-17 10:00:00 -0130 NST");
    ASSERT_EQ(containers.size(), 3);
    EXPECT_EQ(containers[0].name, "execbox-a");
    EXPECT_EQ(containers[1].name, "execbox-b");
    EXPECT_EQ(containers[2].name, "execbox-c");
    EXPECT_EQ(std::chrono::system_clock::to_time_t(containers[0].created), 1'792'240'496);
    // The same instant in another time zone
    EXPECT_EQ(containers[1].created, containers[0].created);
    EXPECT_EQ(std::chrono::system_clock::to_time_t(containers[2].created), 1'792'240'496 - 3896);

    EXPECT_TRUE(parse_docker_ps_output("").empty());
    EXPECT_THROW((void)parse_docker_ps_output("execbox-a 2026-10-17"), std::runtime_error);
    EXPECT_THROW((void)parse_docker_ps_output("execbox-a\tyesterday"), std::runtime_error);
}

// NOLINTNEXTLINE
TEST(workspace_sweep, removes_only_old_containers) {
    TemporaryDirectory tmp_dir{"/tmp/execbox-test.XXXXXX"};
    const auto& dir = tmp_dir.path();
    auto now = std::chrono::system_clock::now();
    // Lists two old containers and a fresh one, fails to remove execbox-stuck
    put_file_contents(
        dir + "docker",
        concat_tostr(
            "#!/bin/sh\n"
            "if [ \"$1\" = ps ]; then\n"
            "    printf 'execbox-old\\t",
            docker_time(now - seconds{3600}),
            "\\nexecbox-stuck\\t",
            docker_time(now - seconds{7200}),
            "\\nexecbox-fresh\\t",
            docker_time(now),
            "\\n'\n"
            "    exit 0\n"
            "fi\n"
            "echo \"$@\" >> '",
            dir,
            "calls'\n"
            "if [ \"$3\" = execbox-stuck ]; then\n"
            "    echo 'removal of container execbox-stuck is already in progress' >&2\n"
            "    exit 1\n"
            "fi\n"
        ),
        0755
    );

    size_t removed = 0;
    auto err_log = intercept_logger(errlog, [&] {
        auto log = intercept_logger(stdlog, [&] {
            removed = sweep_orphaned_containers(dir + "docker", seconds{1800});
        });
        EXPECT_NE(log.find("sweep: removed orphaned container execbox-old"), string::npos)
            << log;
    });
    EXPECT_EQ(removed, 1);
    EXPECT_EQ(
        get_file_contents(dir + "calls"), "rm --force execbox-old\nrm --force execbox-stuck\n"
    );
    EXPECT_NE(err_log.find("already in progress"), string::npos) << err_log;
}

// NOLINTNEXTLINE
TEST(workspace_sweep, failing_docker_ps_throws) {
    TemporaryDirectory tmp_dir{"/tmp/execbox-test.XXXXXX"};
    put_file_contents(
        tmp_dir.path() + "docker",
        "#!/bin/sh\necho 'Cannot connect to the Docker daemon'\nexit 1\n",
        0755
    );
    EXPECT_THROW(
        (void)sweep_orphaned_containers(tmp_dir.path() + "docker", seconds{0}),
        std::runtime_error
    );
}
