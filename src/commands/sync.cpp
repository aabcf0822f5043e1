#include "commands/sync.hpp"

#include "config/Config.hpp"
#include "pipeline/SyncOrchestrator.hpp"
#include "tracker/ExportTrackerClient.hpp"
#include "tracker/JiraTrackerClient.hpp"

#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

int cmd_sync(int argc, char** argv) {
    // argv[0] is "sync"
    const std::vector<std::string> args(argv + 1, argv + argc);

    config::Config cfg;
    try {
        config::load_dotenv(config::get_arg(args, "--env", ".env"));
        cfg = config::resolve_config(args, config::process_env);
        config::require_complete(cfg);
    } catch (const std::exception& e) {
        std::cerr << "[error] configuration: " << e.what() << "\n";
        return 1;
    }

    if (cfg.synced_at.empty()) cfg.synced_at = config::utc_timestamp_now();

    std::unique_ptr<tracker::TrackerClient> client;
    if (!cfg.from_file.empty()) {
        client = std::make_unique<tracker::ExportTrackerClient>(cfg.from_file, cfg.jira_host);
    } else {
        client = std::make_unique<tracker::JiraTrackerClient>(cfg.jira_settings());
    }

    pipeline::SyncOptions opt;
    opt.vault_root = cfg.vault_path;
    opt.issues_dir = cfg.issues_dir;
    opt.board_file = cfg.board_file;
    opt.synced_at = cfg.synced_at;

    std::cout << "Starting sync into " << cfg.vault_path << "\n";

    pipeline::SyncReport rep;
    try {
        rep = pipeline::run_sync(*client, opt, std::cout, std::cerr);
    } catch (const std::exception& e) {
        std::cerr << "[error] failed to fetch issues: " << e.what() << "\n";
        return 1;
    }

    if (!rep.ok()) {
        std::cerr << "sync finished with errors: " << rep.failures.size() << " issue(s) failed";
        if (!rep.board_error.empty()) std::cerr << ", board not written";
        std::cerr << "\n";
        for (const auto& f : rep.failures) {
            std::cerr << "- " << (f.key.empty() ? "<no key>" : f.key) << ": " << f.message << "\n";
        }
        return 1;
    }

    if (rep.fetched > 0) {
        std::cout << "Sync complete! written=" << rep.written << " unchanged=" << rep.unchanged;
        if (rep.recovered_markers > 0) std::cout << " recovered_markers=" << rep.recovered_markers;
        std::cout << "\n";
    }
    return 0;
}
