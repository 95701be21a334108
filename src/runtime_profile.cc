#include <algorithm>
#include <array>
#include <execbox/config_file.hh>
#include <execbox/errors.hh>
#include <execbox/file_manip.hh>
#include <execbox/runtime_profile.hh>
#include <execbox/string_utils.hh>

using std::string;
using std::string_view;

namespace execbox {

namespace {

constexpr string_view builtin_profiles = R"===(# Runtime profiles of the ide-<language> images
version: 1
languages: [node, python, java, cpp, go, rust]

node.image: ide-node:latest
node.uid: 1001
node.gid: 1001
node.workspace: /workspace
node.entrypoint: [dumb-init, --]
node.forwards_signals_to_child: true
node.command: [node, main.js]
node.source_file: main.js

python.image: ide-python:latest
python.uid: 1001
python.gid: 1001
python.workspace: /workspace
python.entrypoint: [dumb-init, --]
python.forwards_signals_to_child: true
python.command: [python, main.py]
python.source_file: main.py

java.image: ide-java:latest
java.uid: 1001
java.gid: 1001
java.workspace: /workspace
java.entrypoint: [dumb-init, --]
java.forwards_signals_to_child: true
java.command: [sh, -c, 'javac Main.java && java Main "$@"', java]
java.source_file: Main.java
java.memory: 256m

cpp.image: ide-cpp:latest
cpp.uid: 1001
cpp.gid: 1001
cpp.workspace: /workspace
cpp.entrypoint: [dumb-init, --]
cpp.forwards_signals_to_child: true
cpp.command: [sh, -c, 'g++ -o main main.cpp && ./main "$@"', cpp]
cpp.source_file: main.cpp
cpp.memory: 256m

go.image: ide-go:latest
go.uid: 1001
go.gid: 1001
go.workspace: /workspace
go.entrypoint: [dumb-init, --]
go.forwards_signals_to_child: true
go.command: [go, run, main.go]
go.source_file: main.go
go.memory: 256m

rust.image: ide-rust:latest
rust.uid: 1001
rust.gid: 1001
rust.workspace: /workspace
rust.entrypoint: [dumb-init, --]
rust.forwards_signals_to_child: true
rust.command: [sh, -c, 'rustc main.rs -o main && ./main "$@"', rust]
rust.source_file: main.rs
rust.memory: 256m
)===";

constexpr LimitSet fallback_limits = {
    .wall_time = std::chrono::milliseconds{30'000},
    .cpu_time = std::chrono::milliseconds{30'000},
    .memory_bytes = 128 << 20,
    .max_processes = 50,
    .max_output_bytes = 1 << 20,
    .write_quota_bytes = 100 << 20,
    .open_files = 1024,
    .cpu_cores = 0.5,
    .network = NetworkPolicy::DENIED,
};

RuntimeProfile parse_profile(const ConfigFile& cf, const string& lang) {
    auto var = [&](string_view key) -> const ConfigFile::Variable& {
        return cf[concat_tostr(lang, '.', key)];
    };
    auto required_string = [&](string_view key) -> const string& {
        const auto& v = var(key);
        if (not v.is_set() or v.is_array() or v.as_string().empty()) {
            throw ValidationError("profile ", lang, ": missing or invalid key ", lang, '.', key);
        }
        return v.as_string();
    };
    auto required_array = [&](string_view key, bool allow_empty) {
        const auto& v = var(key);
        if (not v.is_set() or not v.is_array() or (v.as_array().empty() and not allow_empty)) {
            throw ValidationError(
                "profile ", lang, ": missing or invalid array ", lang, '.', key
            );
        }
        return v.as_array();
    };
    auto required_id = [&](string_view key) {
        auto id = var(key).as<uint32_t>();
        if (not id) {
            throw ValidationError("profile ", lang, ": missing or invalid key ", lang, '.', key);
        }
        if (*id == 0) {
            throw ValidationError("profile ", lang, ": ", key, " has to be non-root (non-zero)");
        }
        return *id;
    };
    auto required_bool = [&](string_view key) {
        const auto& v = var(key);
        static constexpr std::array valid = {"true", "false", "on", "off", "1", "0"};
        if (not v.is_set() or v.is_array() or
            std::find(valid.begin(), valid.end(), v.as_string()) == valid.end())
        {
            throw ValidationError("profile ", lang, ": missing or invalid key ", lang, '.', key);
        }
        return v.as_bool();
    };
    auto positive_number = [&](string_view key, auto default_val) {
        using T = decltype(default_val);
        const auto& v = var(key);
        if (not v.is_set()) {
            return default_val;
        }
        auto val = v.as<T>();
        if (not val or *val <= 0) {
            throw ValidationError(
                "profile ", lang, ": invalid value of ", lang, '.', key, ": ", v.as_string()
            );
        }
        return *val;
    };
    auto byte_size = [&](string_view key, uint64_t default_val) {
        const auto& v = var(key);
        if (not v.is_set()) {
            return default_val;
        }
        auto val = parse_byte_size(v.as_string());
        if (not val or *val == 0) {
            throw ValidationError(
                "profile ", lang, ": invalid byte size ", lang, '.', key, ": ", v.as_string()
            );
        }
        return *val;
    };

    RuntimeProfile p = {
        .language = lang,
        .image = required_string("image"),
        .uid = required_id("uid"),
        .gid = required_id("gid"),
        .workspace = required_string("workspace"),
        .entrypoint = required_array("entrypoint", true),
        .forwards_signals_to_child = required_bool("forwards_signals_to_child"),
        .command = required_array("command", false),
        .source_file = required_string("source_file"),
        .default_limits = fallback_limits,
    };
    if (p.workspace.front() != '/') {
        throw ValidationError("profile ", lang, ": workspace has to be an absolute path");
    }
    if (not is_safe_relative_path(p.source_file)) {
        throw ValidationError("profile ", lang, ": invalid source_file: ", p.source_file);
    }

    auto& dl = p.default_limits;
    dl.wall_time = std::chrono::milliseconds{positive_number("wall_time_ms", dl.wall_time.count())};
    dl.cpu_time = std::chrono::milliseconds{positive_number("cpu_time_ms", dl.cpu_time.count())};
    dl.memory_bytes = byte_size("memory", dl.memory_bytes);
    dl.max_processes = positive_number("processes", dl.max_processes);
    dl.max_output_bytes = byte_size("output_bytes", dl.max_output_bytes);
    dl.write_quota_bytes = byte_size("write_quota", dl.write_quota_bytes);
    dl.open_files = positive_number("open_files", dl.open_files);
    dl.cpu_cores = positive_number("cpu_cores", dl.cpu_cores);
    return p;
}

} // namespace

RuntimeProfileRegistry RuntimeProfileRegistry::load_from_string(string_view text) {
    ConfigFile cf;
    cf.load_config_from_string(string{text}, true);

    RuntimeProfileRegistry reg;
    auto version = cf["version"].as<unsigned>();
    if (not version) {
        throw ValidationError("runtime profiles: missing or invalid version");
    }
    if (*version != SUPPORTED_VERSION) {
        throw ValidationError(
            "runtime profiles: unsupported version ",
            *version,
            " (supported: ",
            SUPPORTED_VERSION,
            ')'
        );
    }
    reg.version_ = *version;

    const auto& langs = cf["languages"];
    if (not langs.is_array()) {
        throw ValidationError("runtime profiles: missing array: languages");
    }
    for (const auto& lang : langs.as_array()) {
        if (lang.empty()) {
            throw ValidationError("runtime profiles: empty language id");
        }
        auto [it, inserted] = reg.profiles_.try_emplace(lang, parse_profile(cf, lang));
        if (not inserted) {
            throw ValidationError("runtime profiles: duplicate language: ", lang);
        }
    }
    return reg;
}

RuntimeProfileRegistry RuntimeProfileRegistry::load_from_file(const string& path) {
    return load_from_string(get_file_contents(path));
}

RuntimeProfileRegistry RuntimeProfileRegistry::builtin() {
    return load_from_string(builtin_profiles);
}

string_view RuntimeProfileRegistry::builtin_profiles_text() noexcept { return builtin_profiles; }

const RuntimeProfile& RuntimeProfileRegistry::resolve(string_view language) const {
    auto it = profiles_.find(language);
    if (it == profiles_.end()) {
        throw NotFoundError("unknown language: ", language);
    }
    return it->second;
}

std::vector<string> RuntimeProfileRegistry::languages() const {
    std::vector<string> res;
    res.reserve(profiles_.size());
    for (const auto& [lang, profile] : profiles_) {
        res.emplace_back(lang);
    }
    return res;
}

} // namespace execbox
