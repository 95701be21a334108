#pragma once

#include <execbox/limits.hh>
#include <map>
#include <string>
#include <string_view>
#include <sys/types.h>
#include <vector>

namespace execbox {

// How to execute code of one language
struct RuntimeProfile {
    std::string language;
    std::string image; // used by the container backend
    uid_t uid;
    gid_t gid;
    std::string workspace; // path of the workspace as seen by the process
    // Process that runs the command and forwards OS signals to it e.g. {"dumb-init", "--"}
    std::vector<std::string> entrypoint;
    bool forwards_signals_to_child;
    std::vector<std::string> command; // default command
    std::string source_file; // name of the main source file the command expects
    LimitSet default_limits;
};

class RuntimeProfileRegistry {
    std::map<std::string, RuntimeProfile, std::less<>> profiles_;
    unsigned version_ = 0;

    RuntimeProfileRegistry() = default;

public:
    static constexpr unsigned SUPPORTED_VERSION = 1;

    /**
     * @brief Parses profiles from config text. Keys: version, languages (array) and for each
     *   language L: L.image, L.uid, L.gid, L.workspace, L.entrypoint (array),
     *   L.forwards_signals_to_child, L.command (array), L.source_file and optional default
     *   limits L.wall_time_ms, L.cpu_time_ms, L.memory, L.processes, L.output_bytes,
     *   L.write_quota, L.open_files, L.cpu_cores
     *
     * @errors Throws ConfigFile::ParseError on syntax errors and ValidationError on invalid
     *   profiles (e.g. uid 0 or missing key)
     */
    static RuntimeProfileRegistry load_from_string(std::string_view text);

    // Like load_from_string() but reads the file @p path
    static RuntimeProfileRegistry load_from_file(const std::string& path);

    // Profiles of node, python, java, cpp, go and rust
    static RuntimeProfileRegistry builtin();

    static std::string_view builtin_profiles_text() noexcept;

    // Throws NotFoundError if @p language is unknown
    [[nodiscard]] const RuntimeProfile& resolve(std::string_view language) const;

    [[nodiscard]] unsigned version() const noexcept { return version_; }

    [[nodiscard]] std::vector<std::string> languages() const;
};

} // namespace execbox
