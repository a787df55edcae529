#include <doctest/doctest.h>
#include "espfleet/device.hpp"
#include "espfleet/device_store.hpp"
#include "espfleet/registry.hpp"
#include "test_support.hpp"

using namespace espfleet;
using espfleet_test::TempDir;
using espfleet_test::read_file;
using espfleet_test::write_file;

static DeviceRecord make(const std::string& name, const std::string& host, int port) {
    DeviceRecord r;
    r.name = name;
    r.chip_id = "0x" + std::to_string(port);
    r.host = host;
    r.remote_port = port;
    r.local_port = port;
    return r;
}

TEST_CASE("DeviceStore: missing file loads as an empty registry") {
    TempDir tmp;
    DeviceStore store(tmp.path() / "registry" / "devices.json");
    auto doc = store.load();
    CHECK(doc["device"].is_object());
    CHECK(doc["device"].empty());
}

TEST_CASE("DeviceStore: corrupt documents throw RegistryCorrupt") {
    TempDir tmp;
    const auto file = tmp.path() / "devices.json";
    DeviceStore store(file);

    write_file(file, "{\"device\": ");
    CHECK_THROWS_AS(store.load(), RegistryCorrupt);

    write_file(file, "[]");
    CHECK_THROWS_AS(store.load(), RegistryCorrupt);

    write_file(file, R"({"device": []})");
    CHECK_THROWS_AS(store.load(), RegistryCorrupt);

    write_file(file, R"({"device": {"a": {"remote_port": "4000"}}})");
    CHECK_THROWS_AS(Registry{store}, RegistryCorrupt);
}

TEST_CASE("DeviceStore: save writes indented JSON atomically and round-trips byte for byte") {
    TempDir tmp;
    const auto file = tmp.path() / "nested" / "devices.json";
    DeviceStore store(file);

    nlohmann::json doc{{"device", {{"bench", record_to_json(make("bench", "pi@rack1", 4000))}}}};
    REQUIRE(store.save(doc).ok());
    CHECK_FALSE(std::filesystem::exists(file.string() + ".tmp"));

    const std::string first = read_file(file);
    CHECK(first.back() == '\n');
    REQUIRE(store.save(store.load()).ok());
    CHECK(read_file(file) == first);
}

TEST_CASE("record_from_json applies defaults for omitted fields") {
    auto rec = record_from_json("bare", nlohmann::json::object());
    CHECK(rec.name == "bare");
    CHECK(rec.chip_id.empty());
    CHECK(rec.usb_path.empty());
    CHECK(rec.remote_port == 4000);
    CHECK(rec.local_port == 4000);
}

TEST_CASE("Registry: add, get, list and persistence across instances") {
    TempDir tmp;
    const auto file = tmp.path() / "devices.json";
    {
        Registry reg{DeviceStore{file}};
        DeviceRecord rec = make("bench-c3", "pi@rack1", 4000);
        rec.usb_path = "platform-3f980000.usb-usb-0:1.2:1.0";
        rec.description = "C3 on the left";
        REQUIRE(reg.add(rec).ok());
        REQUIRE(reg.add(make("bench-s3", "pi@rack1", 4001)).ok());
    }

    Registry reg{DeviceStore{file}};
    auto all = reg.list();
    REQUIRE(all.size() == 2);
    CHECK(all[0].name == "bench-c3");
    CHECK(all[1].name == "bench-s3");

    auto got = reg.get("bench-c3");
    REQUIRE(got);
    CHECK(got->usb_path == "platform-3f980000.usb-usb-0:1.2:1.0");
    CHECK(got->description == "C3 on the left");
    CHECK_FALSE(reg.get("nope"));
}

TEST_CASE("Registry: allocate_port picks the smallest free port per host") {
    TempDir tmp;
    Registry reg{DeviceStore{tmp.path() / "devices.json"}};
    CHECK(reg.allocate_port("pi@rack1") == 4000);

    REQUIRE(reg.add(make("a", "pi@rack1", 4000)).ok());
    REQUIRE(reg.add(make("b", "pi@rack1", 4001)).ok());
    REQUIRE(reg.add(make("c", "pi@rack1", 4003)).ok());
    REQUIRE(reg.add(make("d", "pi@rack2", 4000)).ok());

    CHECK(reg.allocate_port("pi@rack1") == 4002);
    CHECK(reg.allocate_port("pi@rack2") == 4001);
    CHECK(reg.allocate_port("pi@rack3") == 4000);
    CHECK(reg.allocate_port("pi@rack1", 5000) == 5000);

    Status st;
    REQUIRE(reg.remove("a", st));
    CHECK(reg.allocate_port("pi@rack1") == 4000);
}

TEST_CASE("Registry: allocate_port is stable until a device is stored") {
    TempDir tmp;
    Registry reg{DeviceStore{tmp.path() / "devices.json"}};
    REQUIRE(reg.add(make("a", "pi@rack1", 4000)).ok());

    const int first = reg.allocate_port("pi@rack1");
    const int second = reg.allocate_port("pi@rack1");
    CHECK(first == 4001);
    CHECK(second == first);
}

TEST_CASE("Registry: text that is not UTF-8 is rejected and nothing is written") {
    TempDir tmp;
    const auto file = tmp.path() / "devices.json";
    Registry reg{DeviceStore{file}};
    REQUIRE(reg.add(make("a", "pi@rack1", 4000)).ok());
    const std::string before = read_file(file);

    DeviceRecord rec = make("b", "pi@rack1", 4001);
    rec.description = "caf\xe9 bench";
    Status st = reg.add(rec);
    CHECK(st.kind == ErrorKind::Usage);
    CHECK(st.reason == "bad_text");
    CHECK(st.detail.find("UTF-8") != std::string::npos);

    CHECK_FALSE(reg.get("b"));
    REQUIRE(reg.get("a"));
    CHECK(read_file(file) == before);
    CHECK_FALSE(std::filesystem::exists(tmp.path() / "devices.json.tmp"));

    // Same record with clean text goes through.
    rec.description = "caf\xc3\xa9 bench";
    CHECK(reg.add(rec).ok());
}

TEST_CASE("Registry: duplicate remote port on one host is a conflict; other hosts are fine") {
    TempDir tmp;
    const auto file = tmp.path() / "devices.json";
    Registry reg{DeviceStore{file}};
    REQUIRE(reg.add(make("a", "pi@rack1", 4000)).ok());

    Status st = reg.add(make("b", "pi@rack1", 4000));
    CHECK(st.kind == ErrorKind::Conflict);
    CHECK(st.reason == "port_conflict");
    CHECK_FALSE(reg.get("b"));

    CHECK(reg.add(make("b", "pi@rack2", 4000)).ok());
    // Re-adding the same name with its own port is an update, not a conflict.
    CHECK(reg.add(make("a", "pi@rack1", 4000)).ok());
}

TEST_CASE("Registry: add validates name and port range") {
    TempDir tmp;
    Registry reg{DeviceStore{tmp.path() / "devices.json"}};
    CHECK(reg.add(make("", "pi@rack1", 4000)).reason == "bad_name");
    CHECK(reg.add(make("x", "pi@rack1", 0)).reason == "bad_port");
    CHECK(reg.add(make("x", "pi@rack1", 70000)).kind == ErrorKind::Usage);
}

TEST_CASE("Registry: mutations reload first so concurrent additions survive") {
    TempDir tmp;
    const auto file = tmp.path() / "devices.json";
    Registry first{DeviceStore{file}};
    Registry second{DeviceStore{file}};

    REQUIRE(first.add(make("a", "pi@rack1", 4000)).ok());
    REQUIRE(second.add(make("b", "pi@rack1", 4001)).ok());

    Registry check{DeviceStore{file}};
    CHECK(check.list().size() == 2);
}

TEST_CASE("Registry: remove reports absence and persists deletion") {
    TempDir tmp;
    const auto file = tmp.path() / "devices.json";
    Registry reg{DeviceStore{file}};
    REQUIRE(reg.add(make("a", "pi@rack1", 4000)).ok());

    Status st;
    CHECK_FALSE(reg.remove("missing", st));
    CHECK(st.ok());
    CHECK(reg.remove("a", st));
    CHECK(st.ok());
    CHECK(Registry{DeviceStore{file}}.list().empty());
}

TEST_CASE("Registry: conflicts() reports collisions in a hand-edited document") {
    TempDir tmp;
    const auto file = tmp.path() / "devices.json";
    write_file(file, R"({"device": {
        "a": {"host": "pi@rack1", "remote_port": 4000},
        "b": {"host": "pi@rack1", "remote_port": 4000},
        "c": {"host": "pi@rack2", "remote_port": 4000}
    }})");

    Registry reg{DeviceStore{file}};
    auto c = reg.conflicts();
    REQUIRE(c.size() == 1);
    CHECK(c[0].host == "pi@rack1");
    CHECK(c[0].port == 4000);
    CHECK(c[0].first == "a");
    CHECK(c[0].second == "b");
}

TEST_CASE("by_host is exact; devices_for_host also tries user@host") {
    TempDir tmp;
    Registry reg{DeviceStore{tmp.path() / "devices.json"}};
    REQUIRE(reg.add(make("a", "pi@rack1", 4000)).ok());
    REQUIRE(reg.add(make("b", "ops@rack2", 4000)).ok());

    CHECK(reg.by_host("rack1").empty());
    CHECK(reg.by_host("pi@rack1").size() == 1);

    CHECK(devices_for_host(reg, "rack1", "pi").size() == 1);
    CHECK(devices_for_host(reg, "pi@rack1", "ops").size() == 1);
    CHECK(devices_for_host(reg, "rack2", "pi").empty());
    CHECK(devices_for_host(reg, "rack2", "ops").size() == 1);
}

TEST_CASE("parse_host and upload_url") {
    auto h = parse_host("rack1", "pi");
    CHECK(h.user == "pi");
    CHECK(h.hostname == "rack1");
    CHECK(h.str() == "pi@rack1");

    auto u = parse_host("ops@lab@rack", "pi");
    CHECK(u.user == "ops");
    CHECK(u.hostname == "lab@rack");

    CHECK(upload_url(4002) == "rfc2217://localhost:4002");
}
