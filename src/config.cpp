// ============================================================================
// config.cpp - implementation for espfleet/config.hpp
// ============================================================================

#include "espfleet/config.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cstdlib>        // getenv
#include <fstream>
#include <system_error>
#include <unistd.h>       // getuid

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace espfleet {

static std::string env_or_empty(const char* name) {
    const char* v = std::getenv(name);
    return (v && *v) ? std::string(v) : std::string();
}

Environment Environment::from_process() {
    Environment env;
    env.home            = env_or_empty("HOME");
    env.user            = env_or_empty("USER");
    env.xdg_config_home = env_or_empty("XDG_CONFIG_HOME");
    env.xdg_runtime_dir = env_or_empty("XDG_RUNTIME_DIR");
    env.uid             = static_cast<unsigned>(::getuid());
    return env;
}

Config Config::rooted_at(const fs::path& config_dir) {
    Config cfg;
    cfg.config_dir   = config_dir;
    cfg.registry_dir = config_dir / "registry";
    cfg.runtime_dir  = config_dir / "run";
    return cfg;
}

Config default_config(const Environment& env) {
    fs::path base = !env.xdg_config_home.empty() ? fs::path(env.xdg_config_home)
                                                 : fs::path(env.home) / ".config";
    Config cfg = Config::rooted_at(base / "espfleet");

    // ControlMaster sockets must live on a short path (sun_path is 108 bytes).
    cfg.runtime_dir = !env.xdg_runtime_dir.empty()
        ? fs::path(env.xdg_runtime_dir) / "espfleet"
        : fs::path("/tmp") / ("espfleet-" + std::to_string(env.uid));

    if (!env.user.empty()) cfg.default_user = env.user;
    return cfg;
}

// Read one optional key with a type check. Returns false on type mismatch.
template <typename T>
static bool read_key(const json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it == j.end()) return true;
    try {
        out = it->template get<T>();
    } catch (const json::type_error&) {
        return false;
    }
    return true;
}

Status load_settings(Config& cfg) {
    const fs::path file = cfg.settings_file();
    std::error_code ec;
    if (!fs::exists(file, ec)) return Status::success();

    std::ifstream in(file);
    if (!in) {
        return Status::error(ErrorKind::Io, "bad_config", "cannot open " + file.string());
    }

    json j;
    try {
        in >> j;
    } catch (const json::parse_error& e) {
        return Status::error(ErrorKind::Io, "bad_config", file.string() + ": " + e.what());
    }
    if (!j.is_object()) {
        return Status::error(ErrorKind::Io, "bad_config", file.string() + ": top level must be an object");
    }

    Config next = cfg;
    bool ok = read_key(j, "default_user", next.default_user)
           && read_key(j, "ssh", next.ssh_binary)
           && read_key(j, "git", next.git_binary)
           && read_key(j, "connect_timeout_s", next.connect_timeout_s)
           && read_key(j, "control_persist_s", next.control_persist_s)
           && read_key(j, "command_timeout_ms", next.command_timeout_ms)
           && read_key(j, "baud", next.baud);
    if (!ok) {
        return Status::error(ErrorKind::Io, "bad_config", file.string() + ": wrong value type");
    }

    cfg = next;
    spdlog::debug("config: loaded {}", file.string());
    return Status::success();
}

Status ensure_dirs(const Config& cfg) {
    for (const fs::path& dir : {cfg.config_dir, cfg.registry_dir, cfg.runtime_dir}) {
        std::error_code ec;
        fs::create_directories(dir, ec);
        if (ec) {
            return Status::error(ErrorKind::Io, "mkdir_failed", dir.string() + ": " + ec.message());
        }
    }
    std::error_code ec;
    fs::permissions(cfg.runtime_dir, fs::perms::owner_all, fs::perm_options::replace, ec);
    if (ec) {
        return Status::error(ErrorKind::Io, "chmod_failed", cfg.runtime_dir.string() + ": " + ec.message());
    }
    return Status::success();
}

} // namespace espfleet
