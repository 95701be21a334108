#include <charconv>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <execbox/cancellation.hh>
#include <execbox/config_file.hh>
#include <execbox/errmsg.hh>
#include <execbox/errors.hh>
#include <execbox/execbox_config.hh>
#include <execbox/executor.hh>
#include <execbox/file_manip.hh>
#include <execbox/logger.hh>
#include <execbox/random.hh>
#include <execbox/result_assembler.hh>
#include <execbox/runtime_profile.hh>
#include <map>
#include <optional>
#include <string_view>
#include <unistd.h>
#include <vector>

using std::string;
using std::string_view;

namespace {

constexpr string_view DEFAULT_CONFIG_FILE = "execbox.conf";

enum ExitCode {
    RESULT_PRODUCED = 0,
    REJECTED = 1,
    INFRASTRUCTURE_FAULT = 2,
};

struct CmdOptions {
    std::optional<string> config_file;
    std::optional<string> stdin_file;
    std::optional<std::chrono::milliseconds> timeout;
    execbox::LimitOverrides overrides;
    std::map<string, string> environment;
    std::vector<string> arguments;
    bool capture_combined = false;
    bool verbose = false;
    string language;
    std::vector<string> files; // path or name=path
};

void print_help(const char* program_name) {
    if (not program_name) {
        program_name = "execbox";
    }
    // clang-format off
    printf("Usage: %s [options] <language> <file>...\n"
           "Runs the files in a sandbox of the language and prints the result.\n"
           "<file> is either path or name=path, by default the first file is named as the\n"
           "language's main source file and the others keep their base names.\n"
           "Options:\n"
           "  -c, --config <path>     Configuration file (default: execbox.conf if present)\n"
           "  -i, --stdin <path>      Feed the file to stdin ('-' means own stdin)\n"
           "  -t, --timeout <ms>      Wall time limit\n"
           "      --cpu-time <ms>     CPU time limit\n"
           "  -m, --memory <size>     Memory limit e.g. 128m\n"
           "      --processes <n>     Limit of processes and threads\n"
           "      --output <size>     Limit of captured bytes of each output stream\n"
           "      --write-quota <size>\n"
           "                          Maximum size of a file written by the sandbox\n"
           "      --network           Request network access\n"
           "  -e, --env NAME=VALUE    Set environment variable (repeatable)\n"
           "  -a, --arg <arg>         Append argument to the command (repeatable)\n"
           "      --combined          Also capture stdout and stderr interleaved\n"
           "  -v, --verbose           Enable debug log\n"
           "  -h, --help              Display this information\n"
           "Exit status: 0 if the execution result was printed, 1 if the request was\n"
           "rejected, 2 if the sandbox failed.\n", program_name);
    // clang-format on
}

template <class T>
T parse_number(string_view option, string_view str) {
    T res{};
    auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), res);
    if (ec != std::errc{} or ptr != str.data() + str.size() or str.empty()) {
        throw execbox::ValidationError("invalid value of ", option, ": ", str);
    }
    return res;
}

int64_t parse_size(string_view option, string_view str) {
    auto val = execbox::parse_byte_size(str);
    if (not val or *val > static_cast<uint64_t>(INT64_MAX)) {
        throw execbox::ValidationError("invalid size of ", option, ": ", str);
    }
    return static_cast<int64_t>(*val);
}

// Throws ValidationError on invalid options
CmdOptions parse_cmd_options(int argc, char** argv) {
    CmdOptions opts;
    std::vector<string_view> positional;
    for (int i = 1; i < argc; ++i) {
        string_view arg = argv[i];
        auto value = [&]() -> string_view {
            if (i + 1 == argc) {
                throw execbox::ValidationError("option ", arg, " requires a value");
            }
            return argv[++i];
        };
        using std::chrono::milliseconds;
        if (arg == "-h" or arg == "--help") {
            print_help(argv[0]);
            exit(RESULT_PRODUCED);
        } else if (arg == "-c" or arg == "--config") {
            opts.config_file = string{value()};
        } else if (arg == "-i" or arg == "--stdin") {
            opts.stdin_file = string{value()};
        } else if (arg == "-t" or arg == "--timeout") {
            opts.timeout = milliseconds{parse_number<int64_t>(arg, value())};
        } else if (arg == "--cpu-time") {
            opts.overrides.cpu_time = milliseconds{parse_number<int64_t>(arg, value())};
        } else if (arg == "-m" or arg == "--memory") {
            opts.overrides.memory_bytes = parse_size(arg, value());
        } else if (arg == "--processes") {
            opts.overrides.max_processes = parse_number<int64_t>(arg, value());
        } else if (arg == "--output") {
            opts.overrides.max_output_bytes = parse_size(arg, value());
        } else if (arg == "--write-quota") {
            opts.overrides.write_quota_bytes = parse_size(arg, value());
        } else if (arg == "--network") {
            opts.overrides.network = execbox::NetworkPolicy::ALLOWED;
        } else if (arg == "-e" or arg == "--env") {
            auto var = value();
            auto eq = var.find('=');
            if (eq == string_view::npos) {
                throw execbox::ValidationError("expected NAME=VALUE, got: ", var);
            }
            opts.environment.insert_or_assign(
                string{var.substr(0, eq)}, string{var.substr(eq + 1)}
            );
        } else if (arg == "-a" or arg == "--arg") {
            opts.arguments.emplace_back(value());
        } else if (arg == "--combined") {
            opts.capture_combined = true;
        } else if (arg == "-v" or arg == "--verbose") {
            opts.verbose = true;
        } else if (arg.size() > 1 and arg.front() == '-') {
            throw execbox::ValidationError("unknown option: ", arg);
        } else {
            positional.emplace_back(arg);
        }
    }
    if (positional.size() < 2) {
        throw execbox::ValidationError("expected a language and at least one file");
    }
    opts.language = positional.front();
    opts.files.assign(positional.begin() + 1, positional.end());
    return opts;
}

std::vector<execbox::SourceFile>
read_source_files(const std::vector<string>& files, const execbox::RuntimeProfile& profile) {
    std::vector<execbox::SourceFile> res;
    for (size_t i = 0; i < files.size(); ++i) {
        string_view file = files[i];
        string name;
        string path;
        if (auto eq = file.find('='); eq != string_view::npos) {
            name = file.substr(0, eq);
            path = file.substr(eq + 1);
        } else if (i == 0) {
            name = profile.source_file;
            path = file;
        } else {
            auto slash = file.rfind('/');
            name = file.substr(slash == string_view::npos ? 0 : slash + 1);
            path = file;
        }
        try {
            res.push_back({.path = std::move(name), .content = get_file_contents(path)});
        } catch (const std::exception& e) {
            throw execbox::ValidationError("cannot read source file: ", e.what());
        }
    }
    return res;
}

void print_stream(string_view name, const execbox::CapturedStream& stream) {
    printf("--- %.*s ---\n", static_cast<int>(name.size()), name.data());
    (void)fwrite(stream.data.data(), 1, stream.data.size(), stdout);
    if (not stream.data.empty() and stream.data.back() != '\n') {
        putchar('\n');
    }
}

void print_result(const execbox::ExecutionResult& res) {
    auto print = [](string_view key, auto&&... value) {
        auto line = concat_tostr(key, ": ", std::forward<decltype(value)>(value)..., '\n');
        (void)fwrite(line.data(), 1, line.size(), stdout);
    };
    auto stream_info = [](const execbox::CapturedStream& stream) {
        return concat_tostr(stream.total_bytes, stream.truncated() ? " (truncated)" : "");
    };
    print("request_id", res.request_id);
    print("classification", to_str(res.classification));
    print("status", res.status_description);
    if (res.exit_code) {
        print("exit_code", *res.exit_code);
    }
    if (res.signal) {
        print("signal", *res.signal);
    }
    if (res.classification == execbox::Classification::INFRASTRUCTURE_ERROR) {
        return;
    }
    print("wall_time_ms", res.wall_time.count());
    if (res.cpu_time) {
        print("cpu_time_ms", res.cpu_time->count() / 1000);
    }
    if (res.peak_memory_bytes) {
        print("peak_memory_bytes", *res.peak_memory_bytes);
    }
    print("stdout_bytes", stream_info(res.stdout_stream));
    print("stderr_bytes", stream_info(res.stderr_stream));
    if (res.combined_stream) {
        print("combined_bytes", stream_info(*res.combined_stream));
    }
    print_stream("stdout", res.stdout_stream);
    print_stream("stderr", res.stderr_stream);
    if (res.combined_stream) {
        print_stream("combined", *res.combined_stream);
    }
}

execbox::CancellationToken* cancellation_token = nullptr;

void cancel_on_signal(int /*signum*/) noexcept {
    if (cancellation_token) {
        cancellation_token->cancel();
    }
}

int true_main(int argc, char** argv) {
    CmdOptions opts;
    execbox::ExecutionRequest req;
    try {
        opts = parse_cmd_options(argc, argv);
    } catch (const execbox::ValidationError& e) {
        errlog(e.what());
        print_help(argv[0]);
        return REJECTED;
    }
    if (opts.verbose) {
        debuglog.use(stderr);
    }

    try {
        execbox::Config config;
        if (opts.config_file) {
            config = execbox::load_config(*opts.config_file);
        } else if (access(DEFAULT_CONFIG_FILE.data(), F_OK) == 0) {
            config = execbox::load_config(string{DEFAULT_CONFIG_FILE});
        }
        execbox::open_log_files(config);

        auto registry = config.profiles_file
            ? execbox::RuntimeProfileRegistry::load_from_file(*config.profiles_file)
            : execbox::RuntimeProfileRegistry::builtin();
        const auto& profile = registry.resolve(opts.language);

        req.id = random_hex_string(32);
        req.language = opts.language;
        req.files = read_source_files(opts.files, profile);
        if (opts.stdin_file) {
            req.stdin_data = *opts.stdin_file == "-" ? get_file_contents(STDIN_FILENO)
                                                     : get_file_contents(*opts.stdin_file);
        }
        req.overrides = opts.overrides;
        req.timeout = opts.timeout;
        req.arguments = std::move(opts.arguments);
        req.environment = std::move(opts.environment);
        req.capture_combined = opts.capture_combined;

        auto backend = execbox::make_isolation_backend(config);
        execbox::Executor executor{registry, *backend, config.executor};

        execbox::CancellationToken token;
        cancellation_token = &token;
        struct sigaction sa = {};
        sa.sa_handler = cancel_on_signal;
        if (sigaction(SIGINT, &sa, nullptr) or sigaction(SIGTERM, &sa, nullptr)) {
            errlog("sigaction()", errmsg());
            return INFRASTRUCTURE_FAULT;
        }

        auto result = executor.execute(req, &token);
        print_result(result);
        return RESULT_PRODUCED;

    } catch (const ConfigFile::ParseError& e) {
        errlog("config: ", e.what(), '\n', e.diagnostics());
        return REJECTED;
    } catch (const execbox::ValidationError& e) {
        errlog(e.what());
        return REJECTED;
    } catch (const execbox::NotFoundError& e) {
        errlog(e.what());
        return REJECTED;
    } catch (const std::exception& e) {
        print_result(execbox::infrastructure_error_result(req.id, e.what()));
        return INFRASTRUCTURE_FAULT;
    }
}

} // namespace

int main(int argc, char** argv) {
    stdlog.label(false);
    errlog.label(false);
    return true_main(argc, argv);
}
