#include <execbox/errors.hh>
#include <execbox/execution_request.hh>
#include <execbox/string_utils.hh>
#include <set>
#include <string_view>

namespace execbox {

void validate_request(const ExecutionRequest& req, uint64_t max_source_bytes) {
    if (not req.id.empty() and not is_valid_request_id(req.id)) {
        throw ValidationError("invalid request id: ", req.id);
    }
    if (req.language.empty()) {
        throw ValidationError("missing language id");
    }
    if (req.files.empty()) {
        throw ValidationError("request has no source files");
    }

    std::set<std::string_view> paths;
    uint64_t total_size = 0;
    for (const auto& file : req.files) {
        if (not is_safe_relative_path(file.path)) {
            throw ValidationError("invalid source file path: \"", file.path, '"');
        }
        if (not paths.emplace(file.path).second) {
            throw ValidationError("duplicated source file path: ", file.path);
        }
        total_size += file.content.size();
    }
    // A file cannot be a directory of another file
    for (auto path : paths) {
        auto dir_prefix = concat_tostr(path, '/');
        auto it = paths.lower_bound(dir_prefix);
        if (it != paths.end() and it->starts_with(dir_prefix)) {
            throw ValidationError("source file path ", path, " is also used as a directory");
        }
    }
    if (total_size > max_source_bytes) {
        throw ValidationError(
            "source payload too big: ", total_size, " bytes (limit: ", max_source_bytes, ')'
        );
    }

    for (const auto& [name, value] : req.environment) {
        if (not is_valid_env_name(name)) {
            throw ValidationError("invalid environment variable name: \"", name, '"');
        }
        if (value.find('\0') != std::string::npos) {
            throw ValidationError("environment variable ", name, " contains a null byte");
        }
    }
    for (const auto& arg : req.arguments) {
        if (arg.find('\0') != std::string::npos) {
            throw ValidationError("argument contains a null byte");
        }
    }
}

} // namespace execbox
