#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "tracker/JiraTrackerClient.hpp"

namespace config {

inline constexpr const char* DEFAULT_JQL =
    "assignee = currentUser() AND statusCategory != Done ORDER BY updated DESC";
inline constexpr const char* DEFAULT_ISSUES_DIR = "Jira Tickets";
inline constexpr const char* DEFAULT_BOARD_FILE = "My Jira Board.md";
inline constexpr int DEFAULT_PAGE_SIZE = 50;

struct Config {
    std::string jira_host;
    std::string jira_user;
    std::string jira_token;      // environment only
    std::string vault_path;
    std::string jql = DEFAULT_JQL;
    std::string issues_dir = DEFAULT_ISSUES_DIR;
    std::string board_file = DEFAULT_BOARD_FILE;
    std::string from_file;       // offline export instead of the REST API
    std::string synced_at;       // empty -> current UTC time
    int page_size = DEFAULT_PAGE_SIZE;

    tracker::JiraSettings jira_settings() const;
};

using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

// getenv, with empty values treated as unset
std::optional<std::string> process_env(const std::string& name);

// Flag > environment > built-in default. `args` excludes the program and
// subcommand names. Throws std::runtime_error on malformed flag values.
Config resolve_config(const std::vector<std::string>& args, const EnvLookup& env);

// Throws std::runtime_error naming the first missing setting.
void require_complete(const Config& cfg);

// KEY=VALUE lines, "#" comments, optional "export " prefix, optional quotes.
std::map<std::string, std::string> parse_dotenv(const std::string& text);

// Loads a .env file into the process environment without overriding
// variables that are already set. A missing file is not an error.
// Returns the number of variables set.
size_t load_dotenv(const std::string& path);

// "2026-10-17T09:30:00Z"
std::string utc_timestamp_now();

// flag helpers shared by the subcommands
bool has_flag(const std::vector<std::string>& args, const std::string& key);
std::string get_arg(const std::vector<std::string>& args, const std::string& key, const std::string& def);

}  // namespace config
