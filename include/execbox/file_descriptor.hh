#pragma once

#include <fcntl.h>
#include <string>
#include <unistd.h>

// Owns a file descriptor, closes it on destruction. The constructors that open a file do not
// throw: check is_open() and errno.
class FileDescriptor {
    int fd_;

public:
    explicit FileDescriptor(int fd = -1) noexcept
    : fd_(fd) {}

    FileDescriptor(const std::string& path, int flags, mode_t mode = 0644) noexcept
    : fd_(::open(path.c_str(), flags, mode)) {}

    // Opens @p path relative to the directory @p dirfd
    FileDescriptor(int dirfd, const std::string& path, int flags, mode_t mode = 0644) noexcept
    : fd_(::openat(dirfd, path.c_str(), flags, mode)) {}

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    FileDescriptor(FileDescriptor&& other) noexcept
    : fd_(other.release()) {}

    FileDescriptor& operator=(FileDescriptor&& other) noexcept {
        reset(other.release());
        return *this;
    }

    ~FileDescriptor() { reset(-1); }

    [[nodiscard]] bool is_open() const noexcept { return fd_ >= 0; }

    // Use is_open() instead
    explicit operator bool() const noexcept = delete;

    // NOLINTNEXTLINE(google-explicit-constructor)
    operator int() const noexcept { return fd_; }

    [[nodiscard]] int release() noexcept {
        int fd = fd_;
        fd_ = -1;
        return fd;
    }

    void reset(int fd) noexcept {
        if (fd_ >= 0) {
            (void)::close(fd_);
        }
        fd_ = fd;
    }

    // Unlike reset() reports the error of close()
    [[nodiscard]] int close() noexcept {
        int rc = fd_ < 0 ? 0 : ::close(fd_);
        fd_ = -1;
        return rc;
    }

    // Returns -1 with errno set on error
    [[nodiscard]] int set_nonblocking() const noexcept {
        int flags = fcntl(fd_, F_GETFL);
        if (flags == -1) {
            return -1;
        }
        return fcntl(fd_, F_SETFL, flags | O_NONBLOCK);
    }
};
