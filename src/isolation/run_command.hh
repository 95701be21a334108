#pragma once

#include <execbox/si.hh>
#include <string>
#include <vector>

namespace execbox::isolation {

struct CommandOutput {
    Si si;
    std::string output; // stdout and stderr combined
};

/**
 * @brief Runs @p argv (searched in PATH) with environment @p env and stdin redirected from
 *   /dev/null, waits for it to exit
 *
 * @errors Throws std::runtime_error if the command cannot be started
 */
CommandOutput
run_command(const std::vector<std::string>& argv, const std::vector<std::string>& env);

// Environment of the current process as NAME=VALUE strings
std::vector<std::string> current_environment();

} // namespace execbox::isolation
