#include <doctest/doctest.h>
#include "espfleet/ser2net.hpp"
#include "espfleet/udev_rules.hpp"
#include "test_support.hpp"

using namespace espfleet;
using espfleet_test::FakeExecutor;
using espfleet_test::TempDir;

static DeviceRecord dev(const std::string& name, int port, const std::string& usb = {}) {
    DeviceRecord d;
    d.name = name;
    d.chip_id = "0x01";
    d.host = "pi@rack1";
    d.usb_path = usb;
    d.remote_port = port;
    d.local_port = port;
    return d;
}

TEST_CASE("generate_ser2net_config: one rfc2217 connection per device") {
    const std::string yaml = generate_ser2net_config({
        dev("bench-c3", 4000, "platform-usb-0:1.1:1.0"),
        dev("s3", 4001),
    });

    const std::string expected =
        "%YAML 1.1\n---\n"
        "\n"
        "connection: &bench_c3\n"
        "  accepter: telnet(rfc2217),tcp,4000\n"
        "  connector: serialdev,/dev/bench-c3,115200n81,local\n"
        "  options:\n"
        "    kickolduser: true\n"
        "\n"
        "connection: &s3\n"
        "  accepter: telnet(rfc2217),tcp,4001\n"
        "  connector: serialdev,/dev/ttyUSB1,115200n81,local\n"
        "  options:\n"
        "    kickolduser: true\n";
    CHECK(yaml == expected);
}

TEST_CASE("generate_ser2net_config: empty host and custom baud") {
    CHECK(generate_ser2net_config({}) == "%YAML 1.1\n---\n");
    const std::string yaml = generate_ser2net_config({dev("a", 4000)}, 921600);
    CHECK(yaml.find("serialdev,/dev/ttyUSB0,921600n81,local") != std::string::npos);
}

TEST_CASE("install_ser2net runs install check, write and restart in order") {
    FakeExecutor exec;
    exec.on("which ser2net", "/usr/sbin/ser2net\n");
    exec.on("sudo tee /etc/ser2net.yaml", "");
    exec.on("systemctl restart ser2net", "");

    REQUIRE(install_ser2net(exec, "pi@rack1", "%YAML 1.1\n---\n").ok());
    REQUIRE(exec.commands.size() == 3);
    CHECK(exec.commands[0].find("which ser2net") == 0);
    CHECK(exec.commands[1].find("'%YAML 1.1\n---\n'") != std::string::npos);
    CHECK(exec.commands[2].find("systemctl enable ser2net") != std::string::npos);
}

TEST_CASE("install_ser2net: sudo that wants a password is sudo_required") {
    FakeExecutor exec;
    exec.on("which ser2net", "", 1, "sudo: a terminal is required to read the password; a password is required");

    Status st = install_ser2net(exec, "pi@rack1", "x");
    CHECK(st.kind == ErrorKind::Process);
    CHECK(st.reason == "sudo_required");
    CHECK(exec.commands.size() == 1);
}

TEST_CASE("install_ser2net: write and restart failures") {
    SUBCASE("write") {
        FakeExecutor exec;
        exec.on("which ser2net", "/usr/sbin/ser2net\n");
        exec.on("sudo tee", "", 1, "tee: /etc/ser2net.yaml: Read-only file system");
        Status st = install_ser2net(exec, "pi@rack1", "x");
        CHECK(st.reason == "write_failed");
        CHECK(st.detail.find("Read-only") != std::string::npos);
        CHECK(exec.count("systemctl") == 0);
    }
    SUBCASE("restart") {
        FakeExecutor exec;
        exec.on("which ser2net", "/usr/sbin/ser2net\n");
        exec.on("sudo tee", "");
        exec.on("systemctl restart", "", 1, "Job for ser2net.service failed");
        Status st = install_ser2net(exec, "pi@rack1", "x");
        CHECK(st.reason == "restart_failed");
    }
    SUBCASE("connection") {
        FakeExecutor exec;
        exec.run_status = Status::error(ErrorKind::Connection, "connect_failed", "pi@rack1: timed out");
        CHECK(install_ser2net(exec, "pi@rack1", "x").kind == ErrorKind::Connection);
    }
}

TEST_CASE("ser2net_status reads the unit state and the installed config") {
    FakeExecutor exec;
    exec.on("systemctl is-active", "active\n");
    exec.on("cat /etc/ser2net.yaml", "%YAML 1.1\n---\n");

    Ser2netStatus s;
    REQUIRE(ser2net_status(exec, "pi@rack1", s).ok());
    CHECK(s.active);
    CHECK(s.config == "%YAML 1.1\n---\n");

    FakeExecutor idle;
    idle.on("systemctl is-active", "inactive\n", 3);
    idle.on("cat /etc/ser2net.yaml", "", 1);
    REQUIRE(ser2net_status(idle, "pi@rack1", s).ok());
    CHECK_FALSE(s.active);
    CHECK(s.config.empty());
}

TEST_CASE("generate_udev_rules skips devices without a USB path") {
    const std::string rules = generate_udev_rules({
        dev("bench-c3", 4000, "platform-3f980000.usb-usb-0:1.2:1.0"),
        dev("loose", 4001),
    });
    CHECK(rules ==
          "# espfleet: persistent names for registered ESP boards\n"
          "SUBSYSTEM==\"tty\", ENV{ID_PATH}==\"platform-3f980000.usb-usb-0:1.2:1.0\", "
          "SYMLINK+=\"bench-c3\", MODE=\"0666\"\n");
}

TEST_CASE("save_udev_rules writes under the registry, named by hostname") {
    TempDir tmp;
    Config cfg = tmp.config();

    std::filesystem::path path;
    REQUIRE(save_udev_rules(cfg, "pi@rack1", "# rules\n", path).ok());
    CHECK(path == cfg.registry_dir / "udev" / "rack1.rules");
    CHECK(espfleet_test::read_file(path) == "# rules\n");

    // A bare hostname lands in the same file.
    REQUIRE(save_udev_rules(cfg, "rack1", "# again\n", path).ok());
    CHECK(path == cfg.registry_dir / "udev" / "rack1.rules");
    CHECK(espfleet_test::read_file(path) == "# again\n");
}

TEST_CASE("install_udev_rules writes then reloads") {
    FakeExecutor exec;
    exec.on("sudo tee /etc/udev/rules.d/99-espfleet.rules", "");
    exec.on("udevadm control --reload-rules", "");
    REQUIRE(install_udev_rules(exec, "pi@rack1", "# rules\n").ok());
    CHECK(exec.commands.size() == 2);

    FakeExecutor broken;
    broken.on("sudo tee", "");
    broken.on("udevadm control", "", 1, "Failed to send reload request");
    CHECK(install_udev_rules(broken, "pi@rack1", "# rules\n").reason == "reload_failed");
}
