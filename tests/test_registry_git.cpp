#include <doctest/doctest.h>
#include "registry_git.hpp"
#include "subprocess.hpp"
#include "test_support.hpp"

#include <cstdlib>

using namespace espfleet;
using espfleet_test::TempDir;
using espfleet_test::read_file;
using espfleet_test::write_file;

namespace {

// Runs against the real git binary; commits need an identity that does not
// depend on the machine's global config.
bool git_available() {
    ::setenv("GIT_AUTHOR_NAME", "espfleet test", 1);
    ::setenv("GIT_AUTHOR_EMAIL", "test@espfleet.invalid", 1);
    ::setenv("GIT_COMMITTER_NAME", "espfleet test", 1);
    ::setenv("GIT_COMMITTER_EMAIL", "test@espfleet.invalid", 1);
    ::setenv("GIT_CONFIG_NOSYSTEM", "1", 1);

    ProcessOutput out;
    return run_process({"git", "--version"}, ProcessOptions{}, out).ok() && out.exit_code == 0;
}

} // namespace

TEST_CASE("RegistryGit::init creates the registry layout and commits it") {
    if (!git_available()) {
        MESSAGE("git not installed; skipping");
        return;
    }
    TempDir tmp;
    Config cfg = tmp.config();
    RegistryGit git(cfg);

    CHECK_FALSE(git.is_repo());
    CHECK_FALSE(git.status().initialized);

    REQUIRE(git.init("").ok());
    CHECK(git.is_repo());
    CHECK(read_file(cfg.devices_file()) == "{\n  \"device\": {}\n}\n");
    CHECK(std::filesystem::is_directory(cfg.registry_dir / "hosts"));
    CHECK(std::filesystem::is_directory(cfg.registry_dir / "udev"));

    GitStatus gs = git.status();
    CHECK(gs.initialized);
    CHECK_FALSE(gs.dirty);
    CHECK_FALSE(gs.has_remote);
    CHECK_FALSE(gs.branch.empty());
}

TEST_CASE("RegistryGit::init keeps an existing devices.json") {
    if (!git_available()) return;
    TempDir tmp;
    Config cfg = tmp.config();
    const std::string existing =
        "{\n  \"device\": {\n    \"a\": {\n      \"chip_id\": \"0x01\",\n      \"host\": \"pi@rack1\"\n    }\n  }\n}\n";
    write_file(cfg.devices_file(), existing);

    RegistryGit git(cfg);
    REQUIRE(git.init("").ok());
    CHECK(read_file(cfg.devices_file()) == existing);
}

TEST_CASE("RegistryGit::sync commits local edits when no remote is configured") {
    if (!git_available()) return;
    TempDir tmp;
    Config cfg = tmp.config();
    RegistryGit git(cfg);
    REQUIRE(git.init("").ok());

    write_file(cfg.registry_dir / "udev" / "rack1.rules", "# rules\n");
    CHECK(git.status().dirty);

    std::string summary;
    REQUIRE(git.sync("Update registry", summary).ok());
    CHECK(summary == "Committed locally (no remote configured)");
    CHECK_FALSE(git.status().dirty);

    // Nothing to commit is still a successful sync.
    REQUIRE(git.sync("Update registry", summary).ok());
    CHECK(summary == "Committed locally (no remote configured)");
}

TEST_CASE("RegistryGit::sync refuses a registry that is not a repository") {
    TempDir tmp;
    RegistryGit git(tmp.config());
    std::string summary = "stale";
    Status st = git.sync("Update registry", summary);
    CHECK(st.kind == ErrorKind::Usage);
    CHECK(st.reason == "registry_not_initialized");
    CHECK(summary.empty());
}

TEST_CASE("RegistryGit::init with a URL: non-empty target and failed clone") {
    if (!git_available()) return;
    TempDir tmp;
    Config cfg = tmp.config();

    SUBCASE("target has files") {
        write_file(cfg.devices_file(), "{}");
        Status st = RegistryGit(cfg).init("https://example.invalid/registry.git");
        CHECK(st.kind == ErrorKind::Usage);
        CHECK(st.reason == "registry_not_empty");
    }
    SUBCASE("clone fails") {
        Status st = RegistryGit(cfg).init((tmp.path() / "no-such-repo.git").string());
        CHECK(st.kind == ErrorKind::Connection);
        CHECK(st.reason == "clone_failed");
    }
}
