#pragma once
/**
 * @page ef-config espfleet Configuration
 * @file config.hpp
 * @brief Explicit runtime configuration: paths, identities, timeouts.
 *
 * @details
 * PURPOSE
 * -------
 * Every path and tunable the tool needs lives in one value type that `main`
 * builds once and hands to the Registry, the executors and the tunnel layer.
 * Library code never calls getenv() itself, which keeps tests hermetic: a test
 * builds a Config pointing at a temp directory and nothing leaks from $HOME.
 *
 * LAYOUT ON DISK
 * --------------
 *   <config_dir>/config.json          optional local overrides (see below)
 *   <config_dir>/registry/devices.json  device registry (git-trackable)
 *   <config_dir>/registry/udev/         saved udev rules per host
 *   <config_dir>/registry/hosts/        reserved for per-host notes
 *   <runtime_dir>/                      ssh ControlMaster sockets
 *
 * config_dir defaults to $XDG_CONFIG_HOME/espfleet, else ~/.config/espfleet.
 * runtime_dir defaults to $XDG_RUNTIME_DIR/espfleet, else /tmp/espfleet-<uid>.
 *
 * config.json keys (all optional):
 * @code
 *   {
 *     "default_user": "pi",
 *     "ssh": "/usr/bin/ssh",
 *     "git": "git",
 *     "connect_timeout_s": 10,
 *     "control_persist_s": 600,
 *     "command_timeout_ms": 60000,
 *     "baud": 115200
 *   }
 * @endcode
 *
 * TIMEOUTS
 * --------
 * The defaults below are the documented bounds on every blocking step:
 *   - probe_timeout_ms   1000  TCP connect to 127.0.0.1:<port> for liveness.
 *   - confirm_delay_ms   1000  wait after launching a tunnel before probing.
 *   - kill_grace_ms       500  wait after SIGTERM before reusing a port.
 *   - command_timeout_ms 60000 one remote command (esptool can be slow).
 *   - connect_timeout_s    10  ssh ConnectTimeout for the master session.
 *   - control_persist_s   600  idle lifetime of the master if `-O exit` never
 *                              arrives (the process was killed mid-operation).
 */

#include "espfleet/status.hpp"

#include <filesystem>
#include <string>

namespace espfleet {

constexpr int kDefaultProbeTimeoutMs   = 1000;
constexpr int kDefaultConfirmDelayMs   = 1000;
constexpr int kDefaultKillGraceMs      = 500;
constexpr int kDefaultCommandTimeoutMs = 60000;
constexpr int kDefaultConnectTimeoutS  = 10;
constexpr int kDefaultServerAliveS     = 30;
constexpr int kDefaultControlPersistS  = 600;
constexpr int kDefaultBaud             = 115200;
constexpr int kDefaultBasePort         = 4000;

struct TunnelTimeouts {
    int probe_timeout_ms = kDefaultProbeTimeoutMs;
    int confirm_delay_ms = kDefaultConfirmDelayMs;
    int kill_grace_ms    = kDefaultKillGraceMs;
};

struct Config {
    std::filesystem::path config_dir;
    std::filesystem::path registry_dir;
    std::filesystem::path runtime_dir;

    std::string default_user = "pi";
    std::string ssh_binary   = "ssh";
    std::string git_binary   = "git";

    int connect_timeout_s    = kDefaultConnectTimeoutS;
    int command_timeout_ms   = kDefaultCommandTimeoutMs;
    int server_alive_s       = kDefaultServerAliveS;
    int control_persist_s    = kDefaultControlPersistS;
    int baud                 = kDefaultBaud;
    TunnelTimeouts tunnel;

    std::filesystem::path devices_file() const { return registry_dir / "devices.json"; }
    std::filesystem::path settings_file() const { return config_dir / "config.json"; }

    /// Build a Config rooted at @p config_dir with every other field defaulted.
    static Config rooted_at(const std::filesystem::path& config_dir);
};

/**
 * @brief Environment snapshot used to derive defaults.
 *
 * main() fills this from getenv(); tests fill it by hand.
 */
struct Environment {
    std::string home;
    std::string user;
    std::string xdg_config_home;
    std::string xdg_runtime_dir;
    unsigned    uid = 0;

    static Environment from_process();
};

/// Defaults derived from @p env (no file access).
Config default_config(const Environment& env);

/**
 * @brief Apply <config_dir>/config.json on top of @p cfg.
 *
 * A missing file is not an error. A file that is not a JSON object, or a key
 * with the wrong type, yields ErrorKind::Io with reason "bad_config" and
 * leaves @p cfg untouched.
 */
Status load_settings(Config& cfg);

/// Create config_dir, registry_dir and runtime_dir (0700) if missing.
Status ensure_dirs(const Config& cfg);

} // namespace espfleet
