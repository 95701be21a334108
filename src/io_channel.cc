#include <algorithm>
#include <array>
#include <cerrno>
#include <climits>
#include <csignal>
#include <execbox/errmsg.hh>
#include <execbox/io_channel.hh>
#include <execbox/logger.hh>
#include <execbox/macros/throw.hh>
#include <execbox/pipe.hh>
#include <execbox/signal_blocking.hh>
#include <fcntl.h>
#include <unistd.h>
#include <vector>

using std::string;

namespace execbox {

namespace {

// The parent's end is non-blocking
Pipe make_pipe(FileDescriptor Pipe::*parent_end) {
    auto p = pipe2(O_CLOEXEC);
    if (!p) {
        THROW("pipe2()", errmsg());
    }
    if (((*p).*parent_end).set_nonblocking()) {
        THROW("fcntl()", errmsg());
    }
    return std::move(*p);
}

} // namespace

IoChannel::IoChannel(string stdin_data, uint64_t max_output_bytes, bool capture_combined)
: stdin_data_{std::move(stdin_data)}
, max_output_bytes_{max_output_bytes} {
    auto in = make_pipe(&Pipe::writable);
    auto out = make_pipe(&Pipe::readable);
    auto err = make_pipe(&Pipe::readable);

    child_stdin_ = std::move(in.readable);
    child_stdout_ = std::move(out.writable);
    child_stderr_ = std::move(err.writable);
    stdout_reader_ = std::move(out.readable);
    stderr_reader_ = std::move(err.readable);
    // Empty stdin is EOF right away
    if (not stdin_data_.empty()) {
        stdin_writer_ = std::move(in.writable);
    }
    if (capture_combined) {
        output_.combined_stream = CapturedStream{};
    }
}

void IoChannel::close_child_ends() noexcept {
    child_stdin_.reset(-1);
    child_stdout_.reset(-1);
    child_stderr_.reset(-1);
}

void IoChannel::write_stdin() noexcept {
    // EPIPE instead of SIGPIPE when the process closes its stdin
    ThreadSignalBlocker sigpipe_blocker{SIGPIPE};
    while (stdin_pos_ < stdin_data_.size()) {
        auto rc =
            write(stdin_writer_, stdin_data_.data() + stdin_pos_, stdin_data_.size() - stdin_pos_);
        if (rc > 0) {
            stdin_pos_ += static_cast<size_t>(rc);
            continue;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN) {
            return;
        }
        if (errno == EPIPE) {
            sigpipe_blocker.discard_pending();
            debuglog("stdin closed by the process after ", stdin_pos_, " bytes");
        } else {
            errlog("writing stdin failed", errmsg());
        }
        break;
    }
    stdin_writer_.reset(-1);
    stdin_data_ = string{};
}

void IoChannel::capture(CapturedStream& stream, std::string_view chunk) const {
    stream.total_bytes += chunk.size();
    if (stream.data.size() < max_output_bytes_) {
        auto space = max_output_bytes_ - stream.data.size();
        stream.data.append(chunk.substr(0, std::min<uint64_t>(space, chunk.size())));
    }
}

bool IoChannel::read_into(int fd, CapturedStream& stream) {
    std::array<char, 1 << 16> buff; // NOLINT(cppcoreguidelines-pro-type-member-init)
    for (;;) {
        auto rc = read(fd, buff.data(), buff.size());
        if (rc > 0) {
            std::string_view chunk{buff.data(), static_cast<size_t>(rc)};
            capture(stream, chunk);
            if (output_.combined_stream) {
                capture(*output_.combined_stream, chunk);
            }
            return true;
        }
        if (rc == 0) {
            return false;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN) {
            return true;
        }
        THROW("read()", errmsg());
    }
}

void IoChannel::poll_and_pump(
    std::span<pollfd> extra, std::optional<std::chrono::milliseconds> timeout
) {
    // Negative fds are ignored by poll()
    auto fd_or_ignored = [](const FileDescriptor& fd) {
        return fd.is_open() ? static_cast<int>(fd) : -1;
    };
    std::vector<pollfd> pfds = {
        {.fd = fd_or_ignored(stdin_writer_), .events = POLLOUT, .revents = 0},
        {.fd = fd_or_ignored(stdout_reader_), .events = POLLIN, .revents = 0},
        {.fd = fd_or_ignored(stderr_reader_), .events = POLLIN, .revents = 0},
    };
    pfds.insert(pfds.end(), extra.begin(), extra.end());

    int timeout_ms = -1;
    if (timeout) {
        timeout_ms = static_cast<int>(std::clamp<int64_t>(timeout->count(), 0, INT_MAX));
    }
    int rc = poll(pfds.data(), pfds.size(), timeout_ms);
    if (rc < 0) {
        if (errno != EINTR) {
            THROW("poll()", errmsg());
        }
        for (auto& pfd : extra) {
            pfd.revents = 0;
        }
        return;
    }

    if (pfds[0].revents) {
        write_stdin();
    }
    if (pfds[1].revents and not read_into(stdout_reader_, output_.stdout_stream)) {
        stdout_reader_.reset(-1);
    }
    if (pfds[2].revents and not read_into(stderr_reader_, output_.stderr_stream)) {
        stderr_reader_.reset(-1);
    }
    for (size_t i = 0; i < extra.size(); ++i) {
        extra[i].revents = pfds[3 + i].revents;
    }
}

void IoChannel::drain(std::chrono::milliseconds timeout) {
    stdin_writer_.reset(-1);
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (not output_closed()) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()
        );
        if (remaining.count() <= 0) {
            debuglog("output is still open after draining for ", timeout.count(), " ms");
            return;
        }
        poll_and_pump({}, remaining);
    }
}

} // namespace execbox
