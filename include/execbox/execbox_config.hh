#pragma once

#include <chrono>
#include <cstdint>
#include <execbox/executor.hh>
#include <execbox/isolation/isolation_backend.hh>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace execbox {

enum class IsolationKind : uint8_t {
    LOCAL,
    CONTAINER,
};

// Contents of execbox.conf
struct Config {
    std::optional<std::string> profiles_file; // std::nullopt means the built-in profiles
    std::string workspace_root = "/tmp";
    IsolationKind isolation = IsolationKind::LOCAL;
    Executor::Options executor = {};
    std::string cgroup_parent; // local isolation only
    bool require_workspace_isolation = false; // local isolation only
    std::string docker_binary = "docker"; // container isolation only
    std::optional<std::string> stdlog_file;
    std::optional<std::string> errlog_file;
    std::chrono::seconds orphan_workspace_max_age{1800};
};

/**
 * @brief Parses the configuration, absent keys keep their defaults and unknown keys are
 *   ignored
 *
 * @errors Throws ConfigFile::ParseError on syntax errors and ValidationError naming the key on
 *   invalid values
 */
Config parse_config(std::string_view text);

// Like parse_config() but reads the file @p path
Config load_config(const std::string& path);

// Redirects stdlog and errlog to the configured files
void open_log_files(const Config& config);

// Throws InfrastructureFault if the backend cannot be used
std::unique_ptr<isolation::IsolationBackend> make_isolation_backend(const Config& config);

} // namespace execbox
