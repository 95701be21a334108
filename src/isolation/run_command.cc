#include "run_command.hh"
#include "spawn_child.hh"

#include <execbox/errmsg.hh>
#include <execbox/file_manip.hh>
#include <execbox/isolation/local_isolation.hh>
#include <execbox/macros/throw.hh>
#include <execbox/pipe.hh>
#include <csignal>
#include <fcntl.h>

extern char** environ; // NOLINT

namespace execbox::isolation {

CommandOutput
run_command(const std::vector<std::string>& argv, const std::vector<std::string>& env) {
    FileDescriptor dev_null{"/dev/null", O_RDONLY | O_CLOEXEC};
    if (!dev_null.is_open()) {
        THROW("open(/dev/null)", errmsg());
    }
    auto output_pipe = pipe2(O_CLOEXEC);
    if (!output_pipe) {
        THROW("pipe2()", errmsg());
    }

    auto child = spawn_child({
        .argv = argv,
        .env = env,
        .working_dir = std::nullopt,
        .stdin_fd = dev_null,
        .stdout_fd = output_pipe->writable,
        .stderr_fd = output_pipe->writable,
    });
    (void)output_pipe->writable.close();

    CommandOutput res;
    try {
        res.output = get_file_contents(output_pipe->readable);
    } catch (const std::exception&) {
        (void)kill(child.pid, SIGKILL);
        (void)wait_for_child(child.pid);
        throw;
    }
    res.si = wait_for_child(child.pid).si;
    return res;
}

std::vector<std::string> current_environment() {
    std::vector<std::string> res;
    for (char** var = environ; *var; ++var) {
        res.emplace_back(*var);
    }
    return res;
}

} // namespace execbox::isolation
