#pragma once

#include <chrono>
#include <execbox/limits.hh>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace execbox {

struct SourceFile {
    std::string path; // relative to the workspace
    std::string content;
};

struct ExecutionRequest {
    std::string id; // generated if empty
    std::string language;
    std::vector<SourceFile> files;
    std::optional<std::string> stdin_data;
    LimitOverrides overrides = {};
    std::optional<std::chrono::milliseconds> timeout;
    std::vector<std::string> arguments = {}; // appended to the profile's command
    std::map<std::string, std::string> environment = {};
    bool capture_combined = false; // also capture stdout and stderr interleaved
};

/**
 * @brief Checks the request's shape: files, paths, environment, arguments and id. Limits are
 *   checked by ResourceLimiter.
 *
 * @errors Throws ValidationError describing the first problem found
 */
void validate_request(const ExecutionRequest& req, uint64_t max_source_bytes);

} // namespace execbox
