#include <array>
#include <cstdint>
#include <execbox/file_descriptor.hh>
#include <execbox/file_manip.hh>
#include <execbox/io_channel.hh>
#include <execbox/pipe.hh>
#include <execbox/throw_assert.hh>
#include <fcntl.h>
#include <gtest/gtest.h>
#include <string>
#include <thread>
#include <utility>
#include <unistd.h>

using execbox::IoChannel;
using std::string;
using std::chrono::milliseconds;

namespace {

FileDescriptor dup_fd(int fd) {
    FileDescriptor res{fcntl(fd, F_DUPFD_CLOEXEC, 0)};
    throw_assert(res.is_open());
    return res;
}

// Copies the stdin end to the stdout end until EOF or until @p limit bytes are copied, like cat
// run as the sandboxed process
std::thread start_echo(IoChannel& io, size_t limit = SIZE_MAX) {
    auto in = dup_fd(io.child_stdin());
    auto out = dup_fd(io.child_stdout());
    io.close_child_ends();
    return std::thread{[in = std::move(in), out = std::move(out), limit]() mutable {
        std::array<char, 4096> buff{};
        size_t copied = 0;
        while (copied < limit) {
            auto rc = read(in, buff.data(), std::min(buff.size(), limit - copied));
            if (rc <= 0) {
                break;
            }
            auto len = static_cast<size_t>(rc);
            throw_assert(write_all(out, buff.data(), len) == len);
            copied += len;
        }
        // Closing stdin early makes the writer get EPIPE
        (void)in.close();
        (void)out.close();
    }};
}

void pump_until_output_closed(IoChannel& io) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds{10};
    while (not io.output_closed()) {
        throw_assert(std::chrono::steady_clock::now() < deadline);
        io.poll_and_pump({}, milliseconds{100});
    }
}

} // namespace

// NOLINTNEXTLINE
TEST(io_channel, captures_stdout_and_stderr) {
    IoChannel io{"", 1024, false};
    ASSERT_EQ(write_all(io.child_stdout(), "out"), 3);
    ASSERT_EQ(write_all(io.child_stderr(), "err"), 3);
    io.close_child_ends();
    EXPECT_TRUE(io.input_closed());
    io.drain(milliseconds{1000});
    ASSERT_TRUE(io.output_closed());

    auto output = io.take_output();
    EXPECT_EQ(output.stdout_stream.data, "out");
    EXPECT_EQ(output.stdout_stream.total_bytes, 3);
    EXPECT_EQ(output.stderr_stream.data, "err");
    EXPECT_FALSE(output.stderr_stream.truncated());
    EXPECT_FALSE(output.combined_stream.has_value());
}

// NOLINTNEXTLINE
TEST(io_channel, output_beyond_cap_is_counted_but_not_kept) {
    IoChannel io{"", 10, true};
    ASSERT_EQ(write_all(io.child_stdout(), "0123456789abcdef"), 16);
    io.close_child_ends();
    io.drain(milliseconds{1000});

    auto output = io.take_output();
    EXPECT_EQ(output.stdout_stream.data, "0123456789");
    EXPECT_EQ(output.stdout_stream.total_bytes, 16);
    EXPECT_TRUE(output.stdout_stream.truncated());
    EXPECT_EQ(output.stderr_stream.data, "");
    EXPECT_FALSE(output.stderr_stream.truncated());
    ASSERT_TRUE(output.combined_stream.has_value());
    EXPECT_EQ(output.combined_stream->data, "0123456789");
    EXPECT_EQ(output.combined_stream->total_bytes, 16);
}

// NOLINTNEXTLINE
TEST(io_channel, combined_stream_interleaves_in_arrival_order) {
    IoChannel io{"", 1024, true};
    FileDescriptor out = dup_fd(io.child_stdout());
    FileDescriptor err = dup_fd(io.child_stderr());
    io.close_child_ends();
    // Each write is pumped before the next one
    std::array<std::pair<int, const char*>, 3> writes = {{
        {out, "a"},
        {err, "B"},
        {out, "c"},
    }};
    for (auto [fd, str] : writes) {
        ASSERT_EQ(write_all(fd, str), 1);
        io.poll_and_pump({}, milliseconds{1000});
    }
    ASSERT_EQ(out.close(), 0);
    ASSERT_EQ(err.close(), 0);
    io.drain(milliseconds{1000});
    const auto& output = io.output();
    EXPECT_EQ(output.stdout_stream.data, "ac");
    EXPECT_EQ(output.stderr_stream.data, "B");
    ASSERT_TRUE(output.combined_stream.has_value());
    EXPECT_EQ(output.combined_stream->data, "aBc");
}

// NOLINTNEXTLINE
TEST(io_channel, stdin_larger_than_pipe_buffer_does_not_deadlock) {
    string input;
    for (int i = 0; input.size() < (4 << 20); ++i) {
        input += std::to_string(i);
        input += '\n';
    }
    IoChannel io{input, 8 << 20, false};
    auto echo = start_echo(io);
    pump_until_output_closed(io);
    echo.join();
    EXPECT_TRUE(io.input_closed());
    EXPECT_EQ(io.output().stdout_stream.total_bytes, input.size());
    EXPECT_TRUE(io.output().stdout_stream.data == input);
}

// NOLINTNEXTLINE
TEST(io_channel, process_closing_stdin_early_is_not_an_error) {
    IoChannel io{string(1 << 20, 'x'), 1 << 20, false};
    auto echo = start_echo(io, 100);
    pump_until_output_closed(io);
    echo.join();
    // The next write gets EPIPE (without killing us with SIGPIPE)
    for (int i = 0; i < 100 and not io.input_closed(); ++i) {
        io.poll_and_pump({}, milliseconds{10});
    }
    EXPECT_TRUE(io.input_closed());
    EXPECT_EQ(io.output().stdout_stream.data, string(100, 'x'));
}

// NOLINTNEXTLINE
TEST(io_channel, empty_stdin_is_eof) {
    IoChannel io{"", 1024, false};
    EXPECT_TRUE(io.input_closed());
    auto in = dup_fd(io.child_stdin());
    io.close_child_ends();
    char c = 0;
    EXPECT_EQ(read(in, &c, 1), 0);
}

// NOLINTNEXTLINE
TEST(io_channel, extra_descriptors_are_polled) {
    IoChannel io{"", 1024, false};
    auto p = pipe2(O_CLOEXEC);
    ASSERT_TRUE(p);
    std::array<pollfd, 1> extra = {{{.fd = p->readable, .events = POLLIN, .revents = 0}}};

    io.poll_and_pump(extra, milliseconds{0});
    EXPECT_EQ(extra[0].revents, 0);

    ASSERT_EQ(write_all(p->writable, "x"), 1);
    io.poll_and_pump(extra, milliseconds{1000});
    EXPECT_TRUE(extra[0].revents & POLLIN);
}

// NOLINTNEXTLINE
TEST(io_channel, drain_gives_up_after_timeout) {
    IoChannel io{"", 1024, false};
    // A leftover writer (e.g. a process that escaped) keeps the output open
    auto leftover = dup_fd(io.child_stdout());
    io.close_child_ends();
    auto start = std::chrono::steady_clock::now();
    io.drain(milliseconds{100});
    auto elapsed = std::chrono::steady_clock::now() - start;
    EXPECT_FALSE(io.output_closed());
    EXPECT_GE(elapsed, milliseconds{100});
    EXPECT_LT(elapsed, milliseconds{5000});
}
