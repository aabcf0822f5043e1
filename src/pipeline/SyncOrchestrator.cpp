#include "pipeline/SyncOrchestrator.hpp"

#include "doc/MarkdownRenderer.hpp"
#include "vault/BoardGenerator.hpp"
#include "vault/FileStore.hpp"
#include "vault/IssueFileWriter.hpp"
#include "vault/SafeFileMerger.hpp"

#include <exception>
#include <optional>
#include <stdexcept>
#include <unordered_set>

namespace fs = std::filesystem;

namespace pipeline {

static std::string join_kinds(const std::vector<std::string>& kinds) {
    std::string out;
    std::unordered_set<std::string> seen;
    for (const auto& k : kinds) {
        if (!seen.insert(k).second) continue;
        if (!out.empty()) out += ", ";
        out += k;
    }
    return out;
}

static void sync_one(const vault::Issue& issue, const SyncOptions& opt, SyncReport& rep,
                     std::ostream& out, std::ostream& err) {
    const fs::path path = vault::issue_file_path(opt.vault_root, opt.issues_dir, issue.key);

    const std::optional<std::string> existing = vault::read_existing(path);

    doc::RenderReport rr;
    const vault::MergeResult merged = vault::render_issue_file_detailed(issue, existing, opt.synced_at, &rr);

    if (!rr.clean()) {
        rep.dropped_nodes += rr.unknown_kinds.size();
        err << "[warn] " << issue.key << ": dropped " << rr.unknown_kinds.size()
            << " unsupported description node(s): " << join_kinds(rr.unknown_kinds) << "\n";
    }
    if (merged.outcome == vault::MergeOutcome::RecoveredMissingMarker) {
        ++rep.recovered_markers;
        err << "[warn] " << issue.key << ": no notes marker in " << path.string()
            << ", existing content kept below a new marker\n";
    }

    if (existing && *existing == merged.content) {
        ++rep.unchanged;
        out << "unchanged " << issue.key << "\n";
        return;
    }

    vault::write_atomic(path, merged.content);
    ++rep.written;
    out << "synced " << issue.key << "\n";
}

SyncReport sync_issues(const std::vector<vault::Issue>& issues, const SyncOptions& opt,
                       std::ostream& out, std::ostream& err) {
    SyncReport rep;
    rep.fetched = issues.size();

    std::unordered_set<std::string> seen;
    seen.reserve(issues.size() * 2 + 8);

    for (const auto& issue : issues) {
        try {
            if (!seen.insert(issue.key).second) {
                throw std::runtime_error("duplicate issue key in this run");
            }
            sync_one(issue, opt, rep, out, err);
        } catch (const std::exception& e) {
            rep.failures.push_back(IssueFailure{issue.key, e.what()});
            err << "[error] " << (issue.key.empty() ? "<no key>" : issue.key) << ": " << e.what() << "\n";
        }
    }

    const fs::path board_path = opt.vault_root / opt.board_file;
    try {
        vault::write_atomic(board_path, vault::overwrite(vault::generate_board(issues)));
        rep.board_written = true;
        out << "wrote board: " << board_path.string() << "\n";
    } catch (const std::exception& e) {
        rep.board_error = e.what();
        err << "[error] board: " << e.what() << "\n";
    }

    return rep;
}

SyncReport run_sync(tracker::TrackerClient& client, const SyncOptions& opt,
                    std::ostream& out, std::ostream& err) {
    out << "Fetching issues from " << client.describe() << "...\n";
    const std::vector<vault::Issue> issues = client.fetch_issues();
    out << "Found " << issues.size() << " issues.\n";

    if (issues.empty()) {
        out << "No issues found. Exiting.\n";
        return SyncReport{};
    }

    return sync_issues(issues, opt, out, err);
}

}  // namespace pipeline
