#include <cerrno>
#include <execbox/file_manip.hh>
#include <execbox/temporary_directory.hh>
#include <gtest/gtest.h>
#include <string>
#include <sys/stat.h>
#include <unistd.h>

using std::string;

namespace {

bool exists(const string& path) {
    struct stat64 st;
    return lstat64(path.c_str(), &st) == 0;
}

} // namespace

// NOLINTNEXTLINE
TEST(file_manip, remove_r) {
    TemporaryDirectory tmp_dir("/tmp/execbox-test.XXXXXX");
    auto root = tmp_dir.path() + "root";
    ASSERT_EQ(mkdir(root.c_str(), 0755), 0);
    ASSERT_EQ(mkdir((root + "/a").c_str(), 0755), 0);
    put_file_contents(root + "/a/f", "data");
    put_file_contents(root + "/g", "data");
    ASSERT_EQ(symlink(tmp_dir.path().c_str(), (root + "/link").c_str()), 0);

    EXPECT_EQ(remove_r(root.c_str()), 0);
    EXPECT_FALSE(exists(root));
    // Symbolic links are removed, not followed
    EXPECT_TRUE(exists(tmp_dir.path()));
}

// NOLINTNEXTLINE
TEST(file_manip, remove_r_of_directories_without_permissions) {
    TemporaryDirectory tmp_dir("/tmp/execbox-test.XXXXXX");
    auto root = tmp_dir.path() + "root";
    ASSERT_EQ(mkdir(root.c_str(), 0755), 0);
    ASSERT_EQ(mkdir((root + "/locked").c_str(), 0755), 0);
    ASSERT_EQ(mkdir((root + "/locked/nested").c_str(), 0755), 0);
    put_file_contents(root + "/locked/nested/f", "data");
    ASSERT_EQ(mkdir((root + "/read_only").c_str(), 0755), 0);
    put_file_contents(root + "/read_only/f", "data");
    ASSERT_EQ(chmod((root + "/locked/nested").c_str(), 0), 0);
    ASSERT_EQ(chmod((root + "/locked").c_str(), 0), 0);
    ASSERT_EQ(chmod((root + "/read_only").c_str(), 0500), 0);

    EXPECT_EQ(remove_r(root.c_str()), 0) << errno;
    EXPECT_FALSE(exists(root));
}

// NOLINTNEXTLINE
TEST(file_manip, remove_r_of_missing_path) {
    TemporaryDirectory tmp_dir("/tmp/execbox-test.XXXXXX");
    errno = 0;
    EXPECT_EQ(remove_r((tmp_dir.path() + "missing").c_str()), -1);
    EXPECT_EQ(errno, ENOENT);
}
