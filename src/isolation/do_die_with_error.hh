#pragma once

#include <array>
#include <cerrno>
#include <charconv>
#include <cstring>
#include <execbox/file_manip.hh>
#include <string_view>
#include <type_traits>
#include <unistd.h>

// Used after fork() in the child process, therefore nothing here allocates memory

namespace execbox::isolation {

template <class T>
void write_piece(int error_fd, T&& piece) noexcept {
    using U = std::remove_cv_t<std::remove_reference_t<T>>;
    if constexpr (std::is_same_v<U, char>) {
        (void)write_all(error_fd, &piece, 1);
    } else if constexpr (std::is_integral_v<U>) {
        std::array<char, 24> buff;
        auto res = std::to_chars(buff.data(), buff.data() + buff.size(), piece);
        (void)write_all(error_fd, buff.data(), static_cast<size_t>(res.ptr - buff.data()));
    } else {
        (void)write_all(error_fd, std::string_view{piece});
    }
}

template <class... Args>
[[noreturn]] void do_die_with_msg(int error_fd, Args&&... msg) noexcept {
    (write_piece(error_fd, std::forward<Args>(msg)), ...);
    _exit(1);
}

template <class... Args>
[[noreturn]] void do_die_with_error(int error_fd, Args&&... msg) noexcept {
    int errnum = errno;
    std::array<char, 64> buff;
    const char* errstr = strerror_r(errnum, buff.data(), buff.size());
    do_die_with_msg(
        error_fd,
        std::forward<Args>(msg)...,
        " - ",
        errstr ? errstr : "Unknown error",
        " (os error ",
        errnum,
        ')'
    );
}

} // namespace execbox::isolation
