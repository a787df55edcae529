// ============================================================================
// cli_commands.cpp - implementation for cli_commands.hpp
// ============================================================================

#include "cli_commands.hpp"
#include "chip_probe.hpp"
#include "registry_git.hpp"
#include "rfc2217.hpp"
#include "tunnel_manager.hpp"
#include "espfleet/device.hpp"
#include "espfleet/device_store.hpp"
#include "espfleet/registration.hpp"
#include "espfleet/registry.hpp"
#include "espfleet/ser2net.hpp"
#include "espfleet/udev_rules.hpp"

#include <spdlog/spdlog.h>

#include <unistd.h>

namespace espfleet {

namespace {

std::string quoted(std::string s) {
    for (auto& c : s) {
        if (c == '"') c = '\'';
        else if (c == '\n' || c == '\r') c = ' ';
    }
    return "\"" + s + "\"";
}

Registry open_registry(const CliContext& ctx) {
    return Registry{DeviceStore{ctx.cfg.devices_file()}};
}

int device_not_found(CliContext& ctx, const std::string& name) {
    return report_error(ctx.err,
                        Status::error(ErrorKind::NotFound, "device_not_found", "no device named '" + name + "'"),
                        "run `espfleet status` to list registered devices");
}

// Resolve an optional device argument into the records to act on.
bool select_devices(CliContext& ctx, const Registry& reg, const std::string& device,
                    std::vector<DeviceRecord>& out, int& exit_code) {
    if (device.empty()) {
        out = reg.list();
        return true;
    }
    auto rec = reg.get(device);
    if (!rec) {
        exit_code = device_not_found(ctx, device);
        return false;
    }
    out.push_back(*rec);
    return true;
}

} // namespace

int report_error(std::ostream& err, const Status& st, const std::string& hint) {
    err << "status=error reason=" << st.reason << " kind=" << to_string(st.kind);
    if (!st.detail.empty()) err << " detail=" << quoted(st.detail);
    err << "\n";
    if (!hint.empty()) err << "hint: " << hint << "\n";
    return st.kind == ErrorKind::Usage ? kExitUsage : kExitFailure;
}

// ---------------------------------------------------------------------------
// Registry and git
// ---------------------------------------------------------------------------

int cmd_init(CliContext& ctx, const std::string& git_url) {
    RegistryGit git(ctx.cfg);
    if (git.is_repo()) {
        ctx.out << "registry=" << ctx.cfg.registry_dir.string() << " state=already_initialized\n";
        return kExitOk;
    }
    Status st = git.init(git_url);
    if (!st.ok()) return report_error(ctx.err, st);
    ctx.out << "registry=" << ctx.cfg.registry_dir.string() << " state=initialized";
    if (!git_url.empty()) ctx.out << " remote=" << git_url;
    ctx.out << "\n";
    return kExitOk;
}

int cmd_sync(CliContext& ctx) {
    RegistryGit git(ctx.cfg);
    std::string summary;
    Status st = git.sync("Update devices", summary);
    if (!st.ok()) {
        std::string hint;
        if (st.reason == "sync_failed") hint = "resolve the conflict in " + ctx.cfg.registry_dir.string() + " and run `espfleet sync` again";
        return report_error(ctx.err, st, hint);
    }
    ctx.out << "sync=ok message=" << quoted(summary) << "\n";
    return kExitOk;
}

int cmd_register(CliContext& ctx, const RegisterArgs& args) {
    Registry reg = open_registry(ctx);

    RegistrationRequest req;
    req.name = args.name;
    req.chip_id = args.chip_id;
    req.host = args.host;
    req.usb_path = args.usb_path;
    req.description = args.description;
    req.port = args.port;
    req.local_port = args.local_port;

    RegistrationPlan plan = plan_registration(reg, req);
    Status st = reg.add(plan.record);
    if (!st.ok()) {
        std::string hint;
        if (st.reason == "port_conflict") hint = "pick another --port or omit it to allocate one";
        return report_error(ctx.err, st, hint);
    }

    const DeviceRecord& rec = plan.record;
    ctx.out << (plan.updated ? "updated=" : "registered=") << rec.name
            << " chip_id=" << rec.chip_id
            << " host=" << rec.host
            << " port=" << rec.remote_port
            << " local_port=" << rec.local_port;
    if (!rec.usb_path.empty()) ctx.out << " usb_path=" << rec.usb_path;
    ctx.out << "\n";
    if (!rec.usb_path.empty()) {
        ctx.out << "hint: install udev rules with `espfleet udev-install " << rec.host << "`\n";
    }
    return kExitOk;
}

int cmd_unregister(CliContext& ctx, const std::string& name) {
    Registry reg = open_registry(ctx);
    Status st;
    if (!reg.remove(name, st)) {
        if (!st.ok()) return report_error(ctx.err, st);
        return device_not_found(ctx, name);
    }
    ctx.out << "removed=" << name << "\n";
    return kExitOk;
}

// ---------------------------------------------------------------------------
// Tunnels
// ---------------------------------------------------------------------------

int cmd_connect(CliContext& ctx, const std::string& device) {
    Registry reg = open_registry(ctx);
    std::vector<DeviceRecord> devices;
    int rc = kExitOk;
    if (!select_devices(ctx, reg, device, devices, rc)) return rc;

    if (devices.empty()) {
        ctx.out << "devices=0\n";
        ctx.out << "hint: find boards with `espfleet scan <host>`\n";
        return kExitOk;
    }

    TunnelManager tunnels(ctx.procs, ctx.cfg);
    int failed = 0;
    for (const auto& dev : devices) {
        if (tunnels.is_open(dev.local_port)) {
            ctx.out << "device=" << dev.name << " state=already_connected port=" << dev.local_port << "\n";
            continue;
        }
        spdlog::info("{}: connecting to {}", dev.name, dev.host);
        Status st = tunnels.create(dev.host, dev.local_port, dev.remote_port);
        if (!st.ok()) {
            ++failed;
            st.detail = dev.name + ": " + st.detail;
            report_error(ctx.err, st, "check `ssh " + dev.host + "` works and ser2net is set up (`espfleet setup " + dev.host + "`)");
            continue;
        }
        ctx.out << "device=" << dev.name << " state=connected port=" << dev.local_port
                << " upload=" << upload_url(dev.local_port) << "\n";
    }
    return failed == 0 ? kExitOk : kExitFailure;
}

int cmd_disconnect(CliContext& ctx, const std::string& device) {
    Registry reg = open_registry(ctx);
    std::vector<DeviceRecord> devices;
    int rc = kExitOk;
    if (!select_devices(ctx, reg, device, devices, rc)) return rc;

    TunnelManager tunnels(ctx.procs, ctx.cfg);
    for (const auto& dev : devices) {
        const bool killed = tunnels.kill(dev.local_port);
        ctx.out << "device=" << dev.name << " state=" << (killed ? "disconnected" : "not_connected") << "\n";
    }
    return kExitOk;
}

int cmd_status(CliContext& ctx) {
    Registry reg = open_registry(ctx);
    const auto devices = reg.list();
    if (devices.empty()) {
        ctx.out << "devices=0\n";
        ctx.out << "hint: find boards with `espfleet scan <host>`\n";
        return kExitOk;
    }

    TunnelManager tunnels(ctx.procs, ctx.cfg);
    for (const auto& dev : devices) {
        const bool open = tunnels.state(dev.local_port) == TunnelState::Open;
        ctx.out << "device=" << dev.name
                << " chip_id=" << dev.chip_id
                << " host=" << dev.host
                << " port=" << dev.local_port
                << " remote_port=" << dev.remote_port
                << " state=" << (open ? "connected" : "disconnected");
        if (open) ctx.out << " upload=" << upload_url(dev.local_port);
        ctx.out << "\n";
    }

    for (const auto& c : reg.conflicts()) {
        ctx.err << "status=warn reason=port_conflict host=" << c.host << " port=" << c.port
                << " devices=" << c.first << "," << c.second << "\n";
    }

    RegistryGit git(ctx.cfg);
    const GitStatus gs = git.status();
    if (gs.initialized && gs.dirty) {
        ctx.out << "registry=dirty\n";
        ctx.out << "hint: commit and push with `espfleet sync`\n";
    }
    return kExitOk;
}

// ---------------------------------------------------------------------------
// Device operations
// ---------------------------------------------------------------------------

int cmd_scan(CliContext& ctx, const std::string& host) {
    std::vector<ScanEntry> entries;
    Status st = scan_host(ctx.exec, host, entries);
    if (!st.ok()) return report_error(ctx.err, st, "check that `ssh " + host + "` works without a password prompt");

    if (entries.empty()) {
        ctx.out << "devices=0 host=" << host << "\n";
        return kExitOk;
    }
    for (const auto& e : entries) {
        ctx.out << "dev=" << e.device_path;
        if (e.identity) {
            ctx.out << " chip=" << (e.identity->chip_type.empty() ? "unknown" : e.identity->chip_type)
                    << " id=" << e.identity->primary_id();
        } else {
            ctx.out << " chip=unknown id=";
        }
        ctx.out << " usb_path=" << e.usb_path << "\n";
    }
    ctx.out << "hint: register with `espfleet register <name> --chip-id <id> --host " << host << "`\n";
    return kExitOk;
}

int cmd_verify(CliContext& ctx, const std::string& device, const std::string& device_path) {
    Registry reg = open_registry(ctx);
    auto dev = reg.get(device);
    if (!dev) return device_not_found(ctx, device);

    std::string path = device_path;
    if (path.empty()) path = dev->usb_path.empty() ? "/dev/ttyUSB0" : "/dev/" + dev->name;

    remote::ScopedConnection session(ctx.exec, dev->host);
    if (!session.ok()) return report_error(ctx.err, session.status());

    VerifyResult result;
    Status st = verify_device(ctx.exec, dev->host, path, dev->chip_id, result);
    if (!st.ok()) return report_error(ctx.err, st);

    if (!result.matched) {
        return report_error(ctx.err, Status::error(ErrorKind::NotFound, "verify_failed", result.detail),
                            "pass --device-path if the board is not on " + path);
    }
    ctx.out << "device=" << dev->name << " verified=" << result.field << " detail=" << quoted(result.detail) << "\n";
    return kExitOk;
}

int cmd_monitor(CliContext& ctx, const std::string& device, int baud, bool raw) {
    Registry reg = open_registry(ctx);
    auto dev = reg.get(device);
    if (!dev) return device_not_found(ctx, device);

    if (baud < 0) {
        return report_error(ctx.err, Status::error(ErrorKind::Usage, "bad_baud", "baud must be positive"));
    }

    TunnelManager tunnels(ctx.procs, ctx.cfg);
    if (!tunnels.is_open(dev->local_port)) {
        return report_error(ctx.err,
                            Status::error(ErrorKind::Connection, "not_connected",
                                          "no tunnel on local port " + std::to_string(dev->local_port)),
                            "run `espfleet connect " + dev->name + "`");
    }

    const int timeout_ms = ctx.cfg.connect_timeout_s * 1000;
    uint32_t rate = static_cast<uint32_t>(baud);
    if (rate == 0) {
        ctx.err << "detecting baud rate...\n";
        rate = detect_baud(dev->local_port, timeout_ms);
        ctx.err << "baud=" << rate << "\n";
    }

    Rfc2217Client client;
    Status st = client.open(dev->local_port, rate, timeout_ms);
    if (!st.ok()) return report_error(ctx.err, st);

    const bool interactive = !raw && ::isatty(STDIN_FILENO);
    ctx.err << "monitor device=" << dev->name << " baud=" << rate
            << (interactive ? " (Ctrl+C to exit)" : "") << "\n";

    st = run_monitor(client, interactive);
    ctx.err << "\ndisconnected\n";
    if (!st.ok()) return report_error(ctx.err, st);
    return kExitOk;
}

// ---------------------------------------------------------------------------
// Remote host setup
// ---------------------------------------------------------------------------

int cmd_setup(CliContext& ctx, const std::string& host, bool show_only) {
    if (show_only) {
        remote::ScopedConnection session(ctx.exec, host);
        if (!session.ok()) return report_error(ctx.err, session.status());
        Ser2netStatus s;
        Status st = ser2net_status(ctx.exec, host, s);
        if (!st.ok()) return report_error(ctx.err, st);
        ctx.out << "host=" << host << " ser2net=" << (s.active ? "active" : "inactive") << "\n";
        ctx.out << s.config;
        if (!s.config.empty() && s.config.back() != '\n') ctx.out << "\n";
        return kExitOk;
    }

    Registry reg = open_registry(ctx);
    const auto devices = devices_for_host(reg, host, ctx.cfg.default_user);
    if (devices.empty()) {
        ctx.out << "devices=0 host=" << host << "\n";
        ctx.out << "hint: run `espfleet scan " << host << "` and register boards first\n";
        return kExitOk;
    }

    const std::string config = generate_ser2net_config(devices, ctx.cfg.baud);

    remote::ScopedConnection session(ctx.exec, host);
    if (!session.ok()) return report_error(ctx.err, session.status());

    Status st = install_ser2net(ctx.exec, host, config);
    if (!st.ok()) return report_error(ctx.err, st);

    ctx.out << "host=" << host << " ser2net=configured devices=" << devices.size() << "\n";
    for (const auto& dev : devices) {
        ctx.out << "device=" << dev.name << " remote_port=" << dev.remote_port << "\n";
    }
    return kExitOk;
}

int cmd_udev_install(CliContext& ctx, const std::string& host) {
    Registry reg = open_registry(ctx);
    std::vector<DeviceRecord> with_path;
    for (const auto& dev : devices_for_host(reg, host, ctx.cfg.default_user)) {
        if (!dev.usb_path.empty()) with_path.push_back(dev);
    }
    if (with_path.empty()) {
        ctx.out << "devices=0 host=" << host << "\n";
        ctx.out << "hint: re-register with --usb-path (see `espfleet scan " << host << "`)\n";
        return kExitOk;
    }

    const std::string rules = generate_udev_rules(with_path);
    std::filesystem::path saved;
    Status st = save_udev_rules(ctx.cfg, host, rules, saved);
    if (!st.ok()) return report_error(ctx.err, st);
    spdlog::info("udev: rules saved to {}", saved.string());

    remote::ScopedConnection session(ctx.exec, host);
    if (!session.ok()) return report_error(ctx.err, session.status());

    st = install_udev_rules(ctx.exec, host, rules);
    if (!st.ok()) return report_error(ctx.err, st);

    ctx.out << "host=" << host << " udev=installed rules=" << saved.string() << "\n";
    for (const auto& dev : with_path) {
        ctx.out << "link=/dev/" << dev.name << " usb_path=" << dev.usb_path << "\n";
    }
    return kExitOk;
}

int cmd_devices(CliContext& ctx, const std::string& host_arg) {
    std::string host = host_arg;
    if (host.empty()) {
        Registry reg = open_registry(ctx);
        const auto all = reg.list();
        if (all.empty()) {
            return report_error(ctx.err,
                                Status::error(ErrorKind::Usage, "no_host", "no host given and no devices registered"),
                                "run `espfleet devices <user@host>`");
        }
        host = all.front().host;
    }

    remote::ScopedConnection session(ctx.exec, host);
    if (!session.ok()) return report_error(ctx.err, session.status());

    std::vector<std::string> paths;
    Status st = list_serial_devices(ctx.exec, host, paths);
    if (!st.ok()) return report_error(ctx.err, st);

    if (paths.empty()) {
        ctx.out << "devices=0 host=" << host << "\n";
        return kExitOk;
    }
    for (const auto& path : paths) {
        std::string info;
        st = describe_serial_device(ctx.exec, host, path, info);
        if (!st.ok()) return report_error(ctx.err, st);
        ctx.out << "dev=" << path << " info=" << quoted(info.empty() ? "unknown" : info) << "\n";
    }
    return kExitOk;
}

} // namespace espfleet
