#include <charconv>
#include <cstdio>
#include <execbox/config_file.hh>
#include <execbox/errors.hh>
#include <execbox/execbox_config.hh>
#include <execbox/logger.hh>
#include <execbox/workspace_sweep.hh>
#include <optional>
#include <string>
#include <string_view>
#include <unistd.h>

using std::string;
using std::string_view;

namespace {

void print_help(const char* program_name) {
    if (not program_name) {
        program_name = "execbox-sweep";
    }
    // clang-format off
    printf("Usage: %s [options] [<workspace root>]\n"
           "Removes workspaces, cgroups (with cgroup_parent set) and containers (with the\n"
           "container isolation) left behind by crashed execbox processes.\n"
           "Options:\n"
           "  -c, --config <path>     Configuration file (default: execbox.conf if present)\n"
           "      --max-age <s>       Remove only what is older than this many seconds\n"
           "                            (default: orphan_workspace_max_age_s from config)\n"
           "  -h, --help              Display this information\n", program_name);
    // clang-format on
}

int true_main(int argc, char** argv) {
    std::optional<string> config_file;
    std::optional<int64_t> max_age_s;
    std::optional<string> workspace_root;
    for (int i = 1; i < argc; ++i) {
        string_view arg = argv[i];
        if (arg == "-h" or arg == "--help") {
            print_help(argv[0]);
            return 0;
        }
        if ((arg == "-c" or arg == "--config") and i + 1 < argc) {
            config_file = argv[++i];
        } else if (arg == "--max-age" and i + 1 < argc) {
            string_view val = argv[++i];
            int64_t secs = 0;
            auto [ptr, ec] = std::from_chars(val.data(), val.data() + val.size(), secs);
            if (ec != std::errc{} or ptr != val.data() + val.size() or secs < 0) {
                errlog("invalid value of --max-age: ", val);
                return 1;
            }
            max_age_s = secs;
        } else if (not arg.starts_with('-') and not workspace_root) {
            workspace_root = arg;
        } else {
            errlog("unexpected argument: ", arg);
            print_help(argv[0]);
            return 1;
        }
    }

    try {
        execbox::Config config;
        if (config_file) {
            config = execbox::load_config(*config_file);
        } else if (access("execbox.conf", F_OK) == 0) {
            config = execbox::load_config("execbox.conf");
        }
        execbox::open_log_files(config);
        auto max_age =
            max_age_s ? std::chrono::seconds{*max_age_s} : config.orphan_workspace_max_age;
        auto removed = execbox::sweep_orphaned_workspaces(
            workspace_root.value_or(config.workspace_root), max_age
        );
        stdlog("removed ", removed, " orphaned workspace(s)");
        if (not config.cgroup_parent.empty()) {
            removed = execbox::sweep_orphaned_cgroups(config.cgroup_parent, max_age);
            stdlog("removed ", removed, " orphaned cgroup(s)");
        }
        if (config.isolation == execbox::IsolationKind::CONTAINER) {
            removed = execbox::sweep_orphaned_containers(config.docker_binary, max_age);
            stdlog("removed ", removed, " orphaned container(s)");
        }
        return 0;
    } catch (const ConfigFile::ParseError& e) {
        errlog("config: ", e.what(), '\n', e.diagnostics());
    } catch (const std::exception& e) {
        errlog(e.what());
    }
    return 1;
}

} // namespace

int main(int argc, char** argv) {
    stdlog.use(stdout);
    stdlog.label(false);
    return true_main(argc, argv);
}
