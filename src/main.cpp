#include <iostream>
#include <string>
#include <cstdlib>          // getenv

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>

#include "cli_commands.hpp"           // cmd_* handlers, exit codes
#include "logging.hpp"                // init_logging()
#include "process_control.hpp"        // LinuxProcessControl
#include "ssh_executor.hpp"           // SshExecutor
#include "espfleet/config.hpp"
#include "espfleet/device_store.hpp"  // RegistryCorrupt

int main(int argc, char** argv) {
  CLI::App app{"espfleet: flash and monitor ESP boards attached to remote Linux hosts"};
  app.require_subcommand(1);

  // ---- global options ----
  std::string config_dir, log_level;
  int verbosity = 0;
  app.add_option("--config-dir", config_dir, "Configuration directory (default $XDG_CONFIG_HOME/espfleet)");
  app.add_option("--log-level", log_level, "trace|debug|info|warn|error|critical|off");
  app.add_flag("-v,--verbose", verbosity, "More diagnostics on stderr (-vv for trace)");

  // ---- registry ----
  std::string git_url;
  auto* sub_init = app.add_subcommand("init", "Create the registry (optionally cloned from a git URL)");
  sub_init->add_option("git_url", git_url, "Remote registry to clone");

  auto* sub_sync = app.add_subcommand("sync", "Commit registry changes, then pull and push");

  std::string scan_host;
  auto* sub_scan = app.add_subcommand("scan", "Probe every serial port on a host with esptool");
  sub_scan->add_option("host", scan_host, "user@host or host")->required();

  espfleet::RegisterArgs reg_args;
  std::string usb_path, description;
  int port = 0, local_port = 0;
  auto* sub_register = app.add_subcommand("register", "Add or update a device");
  sub_register->add_option("name", reg_args.name, "Device name")->required();
  sub_register->add_option("--chip-id", reg_args.chip_id, "Chip ID or MAC from scan")->required();
  sub_register->add_option("--host", reg_args.host, "user@hostname the board is plugged into")->required();
  auto* opt_usb = sub_register->add_option("--usb-path", usb_path, "udev ID_PATH for a stable /dev/<name> link");
  auto* opt_desc = sub_register->add_option("-d,--description", description, "Free text");
  auto* opt_port = sub_register->add_option("--port", port, "Remote ser2net port (default: keep or allocate)")
                       ->check(CLI::Range(1, 65535));
  auto* opt_local = sub_register->add_option("--local-port", local_port, "Local tunnel port (default: remote port)")
                        ->check(CLI::Range(1, 65535));

  std::string unregister_name;
  auto* sub_unregister = app.add_subcommand("unregister", "Remove a device");
  sub_unregister->add_option("name", unregister_name, "Device name")->required();

  // ---- tunnels ----
  std::string connect_device, disconnect_device;
  auto* sub_connect = app.add_subcommand("connect", "Open ssh tunnels (one device, or all)");
  sub_connect->add_option("device", connect_device, "Device name");
  auto* sub_disconnect = app.add_subcommand("disconnect", "Close ssh tunnels (one device, or all)");
  sub_disconnect->add_option("device", disconnect_device, "Device name");

  auto* sub_status = app.add_subcommand("status", "Registered devices and tunnel state");

  // ---- device operations ----
  std::string verify_device, verify_path;
  auto* sub_verify = app.add_subcommand("verify", "Check the board on the port is the registered one");
  sub_verify->add_option("device", verify_device, "Device name")->required();
  sub_verify->add_option("--device-path", verify_path, "Remote serial path (default /dev/<name> or /dev/ttyUSB0)");

  std::string monitor_device;
  int monitor_baud = 0;
  bool monitor_raw = false;
  auto* sub_monitor = app.add_subcommand("monitor", "Serial monitor over the tunnel");
  sub_monitor->add_option("device", monitor_device, "Device name")->required();
  sub_monitor->add_option("-b,--baud", monitor_baud, "Baud rate (auto-detect if omitted)")
      ->check(CLI::PositiveNumber);
  sub_monitor->add_flag("--raw", monitor_raw, "Output only, no keyboard input");

  // ---- remote host setup ----
  std::string setup_host;
  bool setup_show = false;
  auto* sub_setup = app.add_subcommand("setup", "Install and configure ser2net for a host's devices");
  sub_setup->add_option("host", setup_host, "user@host or host")->required();
  sub_setup->add_flag("--show", setup_show, "Print ser2net state and config instead of installing");

  std::string udev_host;
  auto* sub_udev = app.add_subcommand("udev-install", "Install /dev/<name> udev rules on a host");
  sub_udev->add_option("host", udev_host, "user@host or host")->required();

  std::string devices_host;
  auto* sub_devices = app.add_subcommand("devices", "List serial devices on a host");
  sub_devices->add_option("host", devices_host, "user@host or host (default: first registered host)");

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    int rc = app.exit(e);
    return rc == 0 ? espfleet::kExitOk : espfleet::kExitUsage;
  }

  // ---- logging ----
  espfleet::Status st = espfleet::init_logging(
      espfleet::effective_log_level(log_level, verbosity, std::getenv("ESPFLEET_LOG_LEVEL")));
  if (!st.ok()) return espfleet::report_error(std::cerr, st);

  // ---- configuration ----
  espfleet::Config cfg = espfleet::default_config(espfleet::Environment::from_process());
  if (!config_dir.empty()) {
    // ControlMaster sockets stay in the short runtime dir.
    cfg.config_dir   = config_dir;
    cfg.registry_dir = cfg.config_dir / "registry";
  }
  st = espfleet::load_settings(cfg);
  if (!st.ok()) return espfleet::report_error(std::cerr, st, "fix " + cfg.settings_file().string());
  st = espfleet::ensure_dirs(cfg);
  if (!st.ok()) return espfleet::report_error(std::cerr, st);

  spdlog::debug("config_dir={} registry_dir={} runtime_dir={}",
                cfg.config_dir.string(), cfg.registry_dir.string(), cfg.runtime_dir.string());

  espfleet::SshExecutor exec(cfg);
  espfleet::LinuxProcessControl procs(cfg.command_timeout_ms);
  espfleet::CliContext ctx{cfg, exec, procs, std::cout, std::cerr};

  try {
    if (sub_init->parsed())       return espfleet::cmd_init(ctx, git_url);
    if (sub_sync->parsed())       return espfleet::cmd_sync(ctx);
    if (sub_scan->parsed())       return espfleet::cmd_scan(ctx, scan_host);
    if (sub_register->parsed()) {
      if (opt_usb->count() > 0)   reg_args.usb_path = usb_path;
      if (opt_desc->count() > 0)  reg_args.description = description;
      if (opt_port->count() > 0)  reg_args.port = port;
      if (opt_local->count() > 0) reg_args.local_port = local_port;
      return espfleet::cmd_register(ctx, reg_args);
    }
    if (sub_unregister->parsed()) return espfleet::cmd_unregister(ctx, unregister_name);
    if (sub_connect->parsed())    return espfleet::cmd_connect(ctx, connect_device);
    if (sub_disconnect->parsed()) return espfleet::cmd_disconnect(ctx, disconnect_device);
    if (sub_status->parsed())     return espfleet::cmd_status(ctx);
    if (sub_verify->parsed())     return espfleet::cmd_verify(ctx, verify_device, verify_path);
    if (sub_monitor->parsed())    return espfleet::cmd_monitor(ctx, monitor_device, monitor_baud, monitor_raw);
    if (sub_setup->parsed())      return espfleet::cmd_setup(ctx, setup_host, setup_show);
    if (sub_udev->parsed())       return espfleet::cmd_udev_install(ctx, udev_host);
    if (sub_devices->parsed())    return espfleet::cmd_devices(ctx, devices_host);
  } catch (const espfleet::RegistryCorrupt& e) {
    std::cerr << "status=error reason=registry_corrupt kind=io detail=\"" << e.what() << "\"\n"
              << "hint: fix or restore " << cfg.devices_file().string() << " (git history has older copies)\n";
    return espfleet::kExitCorrupt;
  }

  std::cerr << "status=error reason=need_subcommand\n";
  return espfleet::kExitUsage;
}
