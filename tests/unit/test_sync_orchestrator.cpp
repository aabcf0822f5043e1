#include <catch2/catch.hpp>

#include "pipeline/SyncOrchestrator.hpp"
#include "support/TempDir.hpp"
#include "vault/Markers.hpp"

#include <filesystem>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace fs = std::filesystem;
using namespace pipeline;
using testsupport::TempDir;
using testsupport::slurp;
using testsupport::spit;

namespace {

class InMemoryTracker final : public tracker::TrackerClient {
    std::vector<vault::Issue> issues_;
    bool fail_;

public:
    explicit InMemoryTracker(std::vector<vault::Issue> issues, bool fail = false)
        : issues_(std::move(issues)), fail_(fail) {}

    std::vector<vault::Issue> fetch_issues() override {
        if (fail_) throw std::runtime_error("tracker unreachable");
        return issues_;
    }
    std::string describe() const override { return "memory"; }
};

vault::Issue make_issue(const std::string& key, const std::string& status) {
    vault::Issue i;
    i.key = key;
    i.summary = "Summary of " + key;
    i.status = status;
    i.link = "https://j.io/browse/" + key;
    return i;
}

SyncOptions options(const fs::path& root, const std::string& synced_at = "T") {
    SyncOptions o;
    o.vault_root = root;
    o.issues_dir = "Jira Tickets";
    o.board_file = "My Jira Board.md";
    o.synced_at = synced_at;
    return o;
}

}  // namespace

TEST_CASE("sync_issues: writes one file per issue and the board", "[unit][sync]") {
    TempDir dir;
    std::ostringstream out, err;

    const std::vector<vault::Issue> issues = {make_issue("A-1", "To Do"), make_issue("A-2", "Done")};
    const SyncReport rep = sync_issues(issues, options(dir.path()), out, err);

    REQUIRE(rep.ok());
    REQUIRE(rep.fetched == 2);
    REQUIRE(rep.written == 2);
    REQUIRE(rep.board_written);

    const std::string a1 = slurp(dir.path() / "Jira Tickets" / "A-1.md");
    REQUIRE(a1.find("# A-1 Summary of A-1") != std::string::npos);
    REQUIRE(a1.find(vault::NOTES_MARKER) != std::string::npos);

    const std::string board = slurp(dir.path() / "My Jira Board.md");
    REQUIRE(board.find("## To Do\n\n- [ ] [A-1]") != std::string::npos);
    REQUIRE(board.find("## Done\n\n- [ ] [A-2]") != std::string::npos);

    REQUIRE(out.str().find("synced A-1") != std::string::npos);
}

TEST_CASE("sync_issues: user notes survive and unchanged files are not rewritten", "[unit][sync]") {
    TempDir dir;
    std::ostringstream out, err;
    const std::vector<vault::Issue> issues = {make_issue("A-1", "To Do")};
    const fs::path file = dir.path() / "Jira Tickets" / "A-1.md";

    sync_issues(issues, options(dir.path()), out, err);
    const std::string with_notes = slurp(file) + "remember the milk\n";
    spit(file, with_notes);

    const SyncReport again = sync_issues(issues, options(dir.path()), out, err);
    REQUIRE(again.ok());
    REQUIRE(again.unchanged == 1);
    REQUIRE(again.written == 0);
    REQUIRE(slurp(file) == with_notes);

    std::vector<vault::Issue> moved = issues;
    moved[0].status = "Done";
    const SyncReport third = sync_issues(moved, options(dir.path(), "T2"), out, err);
    REQUIRE(third.written == 1);

    const std::string now = slurp(file);
    REQUIRE(now.find("**Status**: Done") != std::string::npos);
    REQUIRE(now.substr(now.find(vault::NOTES_MARKER)) == std::string(vault::NOTES_MARKER) + "\nremember the milk\n");
}

TEST_CASE("sync_issues: a file without a marker is kept and reported", "[unit][sync]") {
    TempDir dir;
    std::ostringstream out, err;
    const fs::path file = dir.path() / "Jira Tickets" / "A-1.md";
    spit(file, "hand written\n");

    const SyncReport rep = sync_issues({make_issue("A-1", "To Do")}, options(dir.path()), out, err);
    REQUIRE(rep.ok());
    REQUIRE(rep.recovered_markers == 1);
    REQUIRE(err.str().find("[warn] A-1: no notes marker") != std::string::npos);

    const std::string content = slurp(file);
    REQUIRE(content.size() > std::string("hand written\n").size());
    REQUIRE(content.substr(content.size() - 13) == "hand written\n");
}

TEST_CASE("sync_issues: one failing issue does not stop the others or the board", "[unit][sync]") {
    TempDir dir;
    std::ostringstream out, err;

    // a directory where A-2's file should go makes its read fail
    fs::create_directories(dir.path() / "Jira Tickets" / "A-2.md");

    vault::Issue empty_key = make_issue("", "To Do");
    const std::vector<vault::Issue> issues = {make_issue("A-1", "To Do"), make_issue("A-2", "To Do"), empty_key,
                                              make_issue("A-3", "Done"), make_issue("A-1", "To Do")};

    const SyncReport rep = sync_issues(issues, options(dir.path()), out, err);

    REQUIRE_FALSE(rep.ok());
    REQUIRE(rep.written == 2);
    REQUIRE(rep.failures.size() == 3);
    REQUIRE(rep.failures[0].key == "A-2");
    REQUIRE(rep.failures[1].key.empty());
    REQUIRE(rep.failures[2].key == "A-1");
    REQUIRE(rep.failures[2].message == "duplicate issue key in this run");

    REQUIRE(fs::exists(dir.path() / "Jira Tickets" / "A-1.md"));
    REQUIRE(fs::exists(dir.path() / "Jira Tickets" / "A-3.md"));
    REQUIRE(rep.board_written);
    REQUIRE(rep.board_error.empty());
}

TEST_CASE("sync_issues: unsupported description nodes are counted", "[unit][sync]") {
    TempDir dir;
    std::ostringstream out, err;

    vault::Issue i = make_issue("A-1", "To Do");
    doc::Document d;
    d.blocks.push_back(doc::make_unknown("table"));
    d.blocks.push_back(doc::make_unknown("table"));
    i.description = d;

    const SyncReport rep = sync_issues({i}, options(dir.path()), out, err);
    REQUIRE(rep.ok());
    REQUIRE(rep.dropped_nodes == 2);
    REQUIRE(err.str().find("dropped 2 unsupported description node(s): table\n") != std::string::npos);
}

TEST_CASE("sync_issues: board failure is reported", "[unit][sync]") {
    TempDir dir;
    std::ostringstream out, err;
    fs::create_directories(dir.path() / "My Jira Board.md" / "occupied");

    const SyncReport rep = sync_issues({make_issue("A-1", "To Do")}, options(dir.path()), out, err);
    REQUIRE(rep.written == 1);
    REQUIRE_FALSE(rep.board_written);
    REQUIRE_FALSE(rep.board_error.empty());
    REQUIRE_FALSE(rep.ok());
}

TEST_CASE("run_sync: empty result writes nothing", "[unit][sync]") {
    TempDir dir;
    std::ostringstream out, err;
    tracker::NullTrackerClient client;

    const SyncReport rep = run_sync(client, options(dir.path()), out, err);
    REQUIRE(rep.ok());
    REQUIRE(rep.fetched == 0);
    REQUIRE(out.str().find("No issues found. Exiting.") != std::string::npos);
    REQUIRE(fs::is_empty(dir.path()));
}

TEST_CASE("run_sync: tracker failure propagates before any write", "[unit][sync]") {
    TempDir dir;
    std::ostringstream out, err;
    InMemoryTracker client({make_issue("A-1", "To Do")}, true);

    REQUIRE_THROWS_AS(run_sync(client, options(dir.path()), out, err), std::runtime_error);
    REQUIRE(fs::is_empty(dir.path()));
}

TEST_CASE("run_sync: fetches then syncs", "[unit][sync]") {
    TempDir dir;
    std::ostringstream out, err;
    InMemoryTracker client({make_issue("A-1", "To Do"), make_issue("A-2", "To Do")});

    const SyncReport rep = run_sync(client, options(dir.path()), out, err);
    REQUIRE(rep.ok());
    REQUIRE(rep.written == 2);
    REQUIRE(out.str().find("Fetching issues from memory...\nFound 2 issues.\n") == 0);
}
