#pragma once

#include <execbox/file_descriptor.hh>

namespace execbox {

// Pollable cancellation flag, cancel() may be called from any thread (and from a signal
// handler)
class CancellationToken {
    FileDescriptor efd_;

public:
    // Throws std::runtime_error if eventfd() fails
    CancellationToken();

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken(CancellationToken&&) noexcept = default;
    CancellationToken& operator=(const CancellationToken&) = delete;
    CancellationToken& operator=(CancellationToken&&) noexcept = default;
    ~CancellationToken() = default;

    void cancel() noexcept;

    [[nodiscard]] bool is_cancelled() const noexcept;

    // Becomes readable (POLLIN) once cancelled
    [[nodiscard]] int fd() const noexcept { return efd_; }
};

} // namespace execbox
