#pragma once

#include <chrono>
#include <cstdint>
#include <execbox/execution_result.hh>
#include <execbox/file_descriptor.hh>
#include <optional>
#include <poll.h>
#include <span>
#include <string>

namespace execbox {

/**
 * @brief Pipes connecting the sandboxed process's standard streams with the controller
 * @details All parent ends are non-blocking and pumped from a single poll() loop: stdin is
 *   written as the process consumes it while stdout and stderr are read, so the process never
 *   blocks on a full pipe. Output beyond the cap is read and counted, but not kept.
 */
class IoChannel {
public:
    struct Output {
        CapturedStream stdout_stream;
        CapturedStream stderr_stream;
        std::optional<CapturedStream> combined_stream;
    };

private:
    std::string stdin_data_;
    size_t stdin_pos_ = 0;
    uint64_t max_output_bytes_;

    FileDescriptor stdin_writer_;
    FileDescriptor stdout_reader_;
    FileDescriptor stderr_reader_;
    // Ends passed to the sandboxed process
    FileDescriptor child_stdin_;
    FileDescriptor child_stdout_;
    FileDescriptor child_stderr_;

    Output output_;

    void write_stdin() noexcept;

    // Returns false on EOF
    bool read_into(int fd, CapturedStream& stream);

    void capture(CapturedStream& stream, std::string_view chunk) const;

public:
    /**
     * @brief Creates the pipes
     *
     * @errors Throws std::runtime_error if creating a pipe fails
     */
    IoChannel(std::string stdin_data, uint64_t max_output_bytes, bool capture_combined);

    IoChannel(const IoChannel&) = delete;
    IoChannel(IoChannel&&) noexcept = default;
    IoChannel& operator=(const IoChannel&) = delete;
    IoChannel& operator=(IoChannel&&) noexcept = default;
    ~IoChannel() = default;

    [[nodiscard]] int child_stdin() const noexcept { return child_stdin_; }

    [[nodiscard]] int child_stdout() const noexcept { return child_stdout_; }

    [[nodiscard]] int child_stderr() const noexcept { return child_stderr_; }

    // Has to be called after the process is spawned, otherwise EOF is never reached
    void close_child_ends() noexcept;

    // Returns true iff EOF was reached on both stdout and stderr
    [[nodiscard]] bool output_closed() const noexcept {
        return not stdout_reader_.is_open() and not stderr_reader_.is_open();
    }

    // Returns true iff the whole stdin was written (or the process closed its stdin)
    [[nodiscard]] bool input_closed() const noexcept { return not stdin_writer_.is_open(); }

    /**
     * @brief Waits (at most @p timeout, std::nullopt means no limit) for events on the pipes
     *   and on @p extra, then pumps the pipes that are ready
     * @details Revents of @p extra are filled. Interrupted poll() returns with no events.
     *
     * @errors Throws std::runtime_error if poll() or reading fails
     */
    void poll_and_pump(std::span<pollfd> extra, std::optional<std::chrono::milliseconds> timeout);

    // Pumps until the output is closed or @p timeout elapses, stops feeding stdin
    void drain(std::chrono::milliseconds timeout);

    [[nodiscard]] const Output& output() const noexcept { return output_; }

    [[nodiscard]] Output take_output() noexcept { return std::move(output_); }
};

} // namespace execbox
