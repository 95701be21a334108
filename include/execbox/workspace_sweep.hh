#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace execbox {

/**
 * @brief Removes workspaces (directories named execbox-*) in @p workspace_root that were last
 *   modified more than @p max_age ago, e.g. left behind by a crashed process
 * @details Failures to remove a single workspace are logged to errlog and skipped.
 *
 * @return number of removed workspaces
 *
 * @errors Throws std::runtime_error if @p workspace_root cannot be read
 */
size_t
sweep_orphaned_workspaces(const std::string& workspace_root, std::chrono::seconds max_age);

/**
 * @brief Removes the sandbox cgroups (directories named execbox-*) in @p cgroup_parent that
 *   were created more than @p max_age ago. A cgroup that still has processes stays (rmdir()
 *   fails with EBUSY) and is logged.
 *
 * @return number of removed cgroups
 *
 * @errors Throws std::runtime_error if @p cgroup_parent cannot be read
 */
size_t sweep_orphaned_cgroups(const std::string& cgroup_parent, std::chrono::seconds max_age);

struct ContainerInfo {
    std::string name;
    std::chrono::system_clock::time_point created;
};

// Command line listing every container (running or not) labelled execbox.request, one
// "<name>\t<creation time>" per line
[[nodiscard]] std::vector<std::string> docker_ps_argv(const std::string& docker_binary);

// Parses the output of the docker_ps_argv() command. Throws std::runtime_error naming the line
// if it is malformed.
[[nodiscard]] std::vector<ContainerInfo> parse_docker_ps_output(std::string_view output);

/**
 * @brief Force-removes (docker rm --force) the containers labelled execbox.request that were
 *   created more than @p max_age ago
 * @details Failures to remove a single container are logged to errlog and skipped.
 *
 * @return number of removed containers
 *
 * @errors Throws std::runtime_error if listing the containers fails
 */
size_t sweep_orphaned_containers(const std::string& docker_binary, std::chrono::seconds max_age);

} // namespace execbox
