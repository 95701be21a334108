#pragma once

#include <cstddef>
#include <fcntl.h>
#include <string>
#include <string_view>
#include <sys/types.h>

/**
 * @brief Removes recursively file/directory @p path relative to a directory file descriptor
 *   @p dirfd. Symbolic links are not followed.
 *
 * @return 0 on success, -1 on error (errno is set)
 */
int remove_rat(int dirfd, const char* path) noexcept;

inline int remove_r(const char* path) noexcept { return remove_rat(AT_FDCWD, path); }

// Writes exactly @p len bytes, retrying on EINTR and partial writes. Returns the number of
// bytes written, which is less than @p len only on error (errno is set).
size_t write_all(int fd, const void* buf, size_t len) noexcept;

inline size_t write_all(int fd, std::string_view str) noexcept {
    return write_all(fd, str.data(), str.size());
}

// Throws std::runtime_error on error
std::string get_file_contents(int fd);

// Throws std::runtime_error on error
std::string get_file_contents(const std::string& path);

/**
 * @brief Creates (or truncates) file @p path and writes @p data to it
 *
 * @errors Throws std::runtime_error if any error occurs
 */
void put_file_contents(const std::string& path, std::string_view data, mode_t mode = 0644);

/**
 * @brief Creates the missing directories on the way to @p relative_path (excluding the last
 *   component) inside directory @p dirfd
 *
 * @errors Throws std::runtime_error if any error occurs
 */
void create_parent_directories_at(int dirfd, std::string_view relative_path, mode_t mode = 0755);
