#include "commands/render.hpp"
#include "commands/sync.hpp"

#include <iostream>
#include <string>

static int print_usage() {
    std::cerr
        << "usage:\n"
        << "  issue-vault sync [options]\n"
        << "  issue-vault render <adf.json>\n"
        << "  issue-vault board <export.json> [--host <host>]\n"
        << "  issue-vault help\n";
    return 1;
}

static int print_sync_help() {
    std::cerr
        << "usage:\n"
        << "  issue-vault sync [options]\n"
        << "\n"
        << "jira:\n"
        << "  --host <host>                env: JIRA_HOST (required)\n"
        << "  --user <email>               env: JIRA_USER (optional; empty means Bearer token)\n"
        << "                               token is read from JIRA_TOKEN only\n"
        << "  --jql <query>                env: JIRA_JQL\n"
        << "                               default: assigned to me, not done\n"
        << "  --page-size <n>              default: 50\n"
        << "  --from-file <path>           read a saved search response instead of the API\n"
        << "\n"
        << "vault:\n"
        << "  --vault <dir>                env: OBSIDIAN_VAULT_PATH (required)\n"
        << "  --issues-dir <name>          env: ISSUE_VAULT_ISSUES_DIR, default: Jira Tickets\n"
        << "  --board <name>               env: ISSUE_VAULT_BOARD, default: My Jira Board.md\n"
        << "\n"
        << "misc:\n"
        << "  --env <path>                 default: .env (missing file is fine)\n"
        << "  --synced-at <timestamp>      default: current UTC time\n";
    return 0;
}

int main(int argc, char** argv) {
    if (argc < 2) return print_usage();

    const std::string cmd = argv[1];

    if (cmd == "help") {
        return print_usage();
    }

    // subcommand help
    if (cmd == "sync" && (argc >= 3 && std::string(argv[2]) == "--help")) return print_sync_help();

    if (cmd == "sync")   return cmd_sync(argc - 1, argv + 1);
    if (cmd == "render") return cmd_render(argc - 1, argv + 1);
    if (cmd == "board")  return cmd_board(argc - 1, argv + 1);

    std::cerr << "unknown command\n";
    return print_usage();
}
