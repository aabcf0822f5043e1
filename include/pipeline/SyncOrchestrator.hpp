#pragma once

#include <cstddef>
#include <filesystem>
#include <ostream>
#include <string>
#include <vector>

#include "tracker/TrackerClient.hpp"
#include "vault/Issue.hpp"

namespace pipeline {

struct SyncOptions {
    std::filesystem::path vault_root;
    std::string issues_dir;
    std::string board_file;
    std::string synced_at;
};

struct IssueFailure {
    std::string key;
    std::string message;
};

struct SyncReport {
    size_t fetched = 0;
    size_t written = 0;
    size_t unchanged = 0;            // content identical to what was on disk
    size_t recovered_markers = 0;    // files that had no notes marker yet
    size_t dropped_nodes = 0;        // unsupported description nodes across all issues
    bool board_written = false;
    std::string board_error;
    std::vector<IssueFailure> failures;

    bool ok() const { return failures.empty() && board_error.empty(); }
};

// Writes one file per issue, then the board. A failure on one issue is
// recorded and the run goes on; the board is written after every issue has
// been attempted. Progress goes to `out`, warnings and errors to `err`.
SyncReport sync_issues(const std::vector<vault::Issue>& issues, const SyncOptions& opt,
                       std::ostream& out, std::ostream& err);

// Fetches first (tracker errors propagate before anything is written), then
// sync_issues. An empty result writes nothing.
SyncReport run_sync(tracker::TrackerClient& client, const SyncOptions& opt,
                    std::ostream& out, std::ostream& err);

}  // namespace pipeline
