#pragma once

#include <execbox/execution_request.hh>
#include <optional>
#include <string>
#include <string_view>
#include <sys/types.h>

namespace execbox::isolation {

inline constexpr std::string_view WORKSPACE_NAME_PREFIX = "execbox-";

struct Owner {
    uid_t uid;
    gid_t gid;
};

// Creates directory <root>/execbox-<request_id> and returns its path
std::string create_workspace_dir(
    const std::string& root, std::string_view request_id, mode_t mode, std::optional<Owner> owner
);

// Creates the file (it must not exist) with missing parent directories, symlinks are not
// followed
void write_workspace_file(
    const std::string& workspace, const SourceFile& file, std::optional<Owner> owner
);

// Removing a missing workspace is not an error
void remove_workspace_dir(const std::string& workspace);

} // namespace execbox::isolation
