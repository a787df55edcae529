#pragma once
/**
 * @file registry_git.hpp
 * @brief Keep the registry directory in git so several operators share one roster.
 *
 * @details
 * The registry directory (devices.json, udev/, hosts/) is a plain git work
 * tree driven through the git command line:
 *
 *   - init(""):   git init, seed an empty devices.json (never overwriting an
 *                 existing one), create hosts/ and udev/, commit.
 *   - init(url):  git clone url into the (empty) registry directory.
 *   - sync():     add everything, commit if anything changed, then pull and
 *                 push when a remote is configured.
 *   - status():   initialized / dirty / branch / remote, for `espfleet status`.
 *
 * Merge conflicts from pull are reported, not resolved: the operator fixes
 * devices.json by hand and runs sync again.
 */

#include "espfleet/config.hpp"
#include "espfleet/status.hpp"
#include "subprocess.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace espfleet {

struct GitStatus {
    bool        initialized = false;
    bool        dirty = false;
    std::string branch;
    bool        has_remote = false;
    std::string remote_url;
};

class RegistryGit {
public:
    explicit RegistryGit(const Config& cfg);

    bool is_repo() const;
    Status init(const std::string& remote_url);
    Status sync(const std::string& message, std::string& summary);
    GitStatus status() const;

private:
    Status git(const std::vector<std::string>& args, ProcessOutput& out) const;
    Status git_ok(const std::vector<std::string>& args, ProcessOutput& out) const;

    std::filesystem::path dir_;
    std::string           git_binary_;
    int                   timeout_ms_;
};

} // namespace espfleet
