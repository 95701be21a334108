#include <execbox/config_file.hh>
#include <execbox/errors.hh>
#include <execbox/execbox_config.hh>
#include <execbox/file_manip.hh>
#include <execbox/isolation/container_isolation.hh>
#include <execbox/isolation/local_isolation.hh>
#include <execbox/logger.hh>
#include <type_traits>

using std::string;
using std::string_view;

namespace execbox {

Config parse_config(string_view text) {
    ConfigFile cf;
    cf.load_config_from_string(string{text}, true);

    auto invalid = [&](string_view key) {
        return ValidationError("config: invalid value of ", key, ": ", cf[key].as_string());
    };
    auto get_string = [&](string_view key, string& dest) {
        const auto& var = cf[key];
        if (var.is_set()) {
            if (var.is_array()) {
                throw invalid(key);
            }
            dest = var.as_string();
        }
    };
    auto get_number = [&](string_view key, auto& dest) {
        const auto& var = cf[key];
        if (var.is_set()) {
            auto val = var.as<std::remove_reference_t<decltype(dest)>>();
            if (not val or *val < 0) {
                throw invalid(key);
            }
            dest = *val;
        }
    };
    auto get_positive_number = [&](string_view key, auto& dest) {
        get_number(key, dest);
        if (dest <= 0) {
            throw invalid(key);
        }
    };
    auto get_byte_size = [&](string_view key, uint64_t& dest) {
        const auto& var = cf[key];
        if (var.is_set()) {
            auto val = parse_byte_size(var.as_string());
            if (not val) {
                throw invalid(key);
            }
            dest = *val;
        }
    };
    auto get_bool = [&](string_view key, bool& dest) {
        const auto& var = cf[key];
        if (var.is_set()) {
            const auto& str = var.as_string();
            if (str != "true" and str != "false" and str != "on" and str != "off" and
                str != "1" and str != "0")
            {
                throw invalid(key);
            }
            dest = var.as_bool();
        }
    };
    auto get_ms = [&](string_view key, std::chrono::milliseconds& dest) {
        auto ms = dest.count();
        get_number(key, ms);
        dest = std::chrono::milliseconds{ms};
    };

    Config c;
    if (cf["profiles_file"].is_set()) {
        c.profiles_file.emplace();
        get_string("profiles_file", *c.profiles_file);
    }
    get_string("workspace_root", c.workspace_root);
    if (const auto& var = cf["isolation"]; var.is_set()) {
        if (var.as_string() == "local") {
            c.isolation = IsolationKind::LOCAL;
        } else if (var.as_string() == "container") {
            c.isolation = IsolationKind::CONTAINER;
        } else {
            throw invalid("isolation");
        }
    }

    auto& ex = c.executor;
    get_positive_number("max_concurrent_executions", ex.max_concurrent_executions);
    get_byte_size("memory_budget", ex.memory_budget_bytes);
    get_ms("grace_period_ms", ex.controller.grace_period);
    get_positive_number("destroy_attempts", ex.controller.destroy_attempts);
    get_byte_size("max_source_bytes", ex.max_source_bytes);

    auto& ceil = ex.ceilings;
    get_ms("max_wall_time_ms", ceil.wall_time);
    get_ms("max_cpu_time_ms", ceil.cpu_time);
    get_byte_size("max_memory", ceil.memory_bytes);
    get_positive_number("max_processes", ceil.max_processes);
    get_byte_size("max_output_bytes", ceil.max_output_bytes);
    get_byte_size("max_write_quota", ceil.write_quota_bytes);
    get_positive_number("max_open_files", ceil.open_files);
    get_positive_number("max_cpu_cores", ceil.cpu_cores);
    get_bool("allow_network", ceil.allow_network);
    if (ceil.wall_time.count() <= 0) {
        throw invalid("max_wall_time_ms");
    }
    if (ceil.cpu_time.count() <= 0) {
        throw invalid("max_cpu_time_ms");
    }

    get_string("cgroup_parent", c.cgroup_parent);
    get_bool("require_workspace_isolation", c.require_workspace_isolation);
    get_string("docker_binary", c.docker_binary);
    if (cf["stdlog_file"].is_set()) {
        c.stdlog_file.emplace();
        get_string("stdlog_file", *c.stdlog_file);
    }
    if (cf["errlog_file"].is_set()) {
        c.errlog_file.emplace();
        get_string("errlog_file", *c.errlog_file);
    }
    auto max_age = c.orphan_workspace_max_age.count();
    get_number("orphan_workspace_max_age_s", max_age);
    c.orphan_workspace_max_age = std::chrono::seconds{max_age};
    return c;
}

Config load_config(const string& path) { return parse_config(get_file_contents(path)); }

void open_log_files(const Config& config) {
    if (config.stdlog_file) {
        stdlog.open(*config.stdlog_file);
    }
    if (config.errlog_file) {
        errlog.open(*config.errlog_file);
    }
}

std::unique_ptr<isolation::IsolationBackend> make_isolation_backend(const Config& config) {
    switch (config.isolation) {
    case IsolationKind::LOCAL:
        return std::make_unique<isolation::LocalIsolation>(isolation::LocalIsolation::Options{
            .workspace_root = config.workspace_root,
            .cgroup_parent = config.cgroup_parent,
            .require_workspace_isolation = config.require_workspace_isolation,
        });
    case IsolationKind::CONTAINER:
        return std::make_unique<isolation::ContainerIsolation>(
            isolation::ContainerIsolation::Options{
                .workspace_root = config.workspace_root,
                .docker_binary = config.docker_binary,
            }
        );
    }
    throw InfrastructureFault("unknown isolation kind");
}

} // namespace execbox
