#include "config/Config.hpp"

#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace config {

static std::string trim_copy(const std::string& s) {
    size_t a = 0;
    while (a < s.size() && std::isspace(static_cast<unsigned char>(s[a]))) ++a;

    size_t b = s.size();
    while (b > a && std::isspace(static_cast<unsigned char>(s[b - 1]))) --b;

    return s.substr(a, b - a);
}

bool has_flag(const std::vector<std::string>& args, const std::string& key) {
    for (const auto& a : args) {
        if (a == key) return true;
    }
    return false;
}

std::string get_arg(const std::vector<std::string>& args, const std::string& key, const std::string& def) {
    for (size_t i = 0; i + 1 < args.size(); ++i) {
        if (args[i] == key) return args[i + 1];
    }
    return def;
}

static std::optional<std::string> get_opt(const std::vector<std::string>& args, const std::string& key) {
    for (size_t i = 0; i + 1 < args.size(); ++i) {
        if (args[i] == key) return args[i + 1];
    }
    return std::nullopt;
}

std::optional<std::string> process_env(const std::string& name) {
    const char* v = std::getenv(name.c_str());
    if (!v || !*v) return std::nullopt;
    return std::string(v);
}

tracker::JiraSettings Config::jira_settings() const {
    tracker::JiraSettings s;
    s.host = jira_host;
    s.user = jira_user;
    s.token = jira_token;
    s.jql = jql;
    s.page_size = page_size;
    return s;
}

Config resolve_config(const std::vector<std::string>& args, const EnvLookup& env) {
    Config cfg;

    auto pick = [&](std::string& field, const char* flag, const char* var) {
        if (flag) {
            if (auto v = get_opt(args, flag)) {
                field = *v;
                return;
            }
        }
        if (var) {
            if (auto v = env(var)) field = *v;
        }
    };

    pick(cfg.jira_host,  "--host",       "JIRA_HOST");
    pick(cfg.jira_user,  "--user",       "JIRA_USER");
    pick(cfg.jira_token, nullptr,        "JIRA_TOKEN");
    pick(cfg.vault_path, "--vault",      "OBSIDIAN_VAULT_PATH");
    pick(cfg.jql,        "--jql",        "JIRA_JQL");
    pick(cfg.issues_dir, "--issues-dir", "ISSUE_VAULT_ISSUES_DIR");
    pick(cfg.board_file, "--board",      "ISSUE_VAULT_BOARD");
    pick(cfg.from_file,  "--from-file",  nullptr);
    pick(cfg.synced_at,  "--synced-at",  nullptr);

    if (auto v = get_opt(args, "--page-size")) {
        try {
            cfg.page_size = std::stoi(*v);
        } catch (const std::exception&) {
            throw std::runtime_error("--page-size must be an integer: " + *v);
        }
        if (cfg.page_size <= 0) throw std::runtime_error("--page-size must be positive: " + *v);
    }

    return cfg;
}

void require_complete(const Config& cfg) {
    if (cfg.vault_path.empty()) {
        throw std::runtime_error("OBSIDIAN_VAULT_PATH must be set (or pass --vault)");
    }
    if (cfg.issues_dir.empty()) throw std::runtime_error("issues folder name cannot be empty");
    if (cfg.board_file.empty()) throw std::runtime_error("board file name cannot be empty");

    if (!cfg.from_file.empty()) return;

    if (cfg.jira_host.empty()) throw std::runtime_error("JIRA_HOST must be set (or pass --host)");
    if (cfg.jira_token.empty()) throw std::runtime_error("JIRA_TOKEN must be set");
}

std::map<std::string, std::string> parse_dotenv(const std::string& text) {
    std::map<std::string, std::string> out;

    std::istringstream in(text);
    std::string raw;
    while (std::getline(in, raw)) {
        std::string line = trim_copy(raw);
        if (line.empty() || line[0] == '#') continue;

        if (line.rfind("export ", 0) == 0) line = trim_copy(line.substr(7));

        const size_t eq = line.find('=');
        if (eq == std::string::npos) continue;

        const std::string key = trim_copy(line.substr(0, eq));
        std::string value = trim_copy(line.substr(eq + 1));
        if (key.empty()) continue;

        if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
            value = value.substr(1, value.size() - 2);
        } else {
            // unquoted: " #" starts a trailing comment
            const size_t hash = value.find(" #");
            if (hash != std::string::npos) value = trim_copy(value.substr(0, hash));
        }

        out[key] = value;
    }

    return out;
}

size_t load_dotenv(const std::string& path) {
    std::ifstream in(path);
    if (!in) return 0;

    std::ostringstream ss;
    ss << in.rdbuf();

    size_t n = 0;
    for (const auto& kv : parse_dotenv(ss.str())) {
        if (std::getenv(kv.first.c_str())) continue;
        if (setenv(kv.first.c_str(), kv.second.c_str(), 0) != 0) {
            throw std::runtime_error("failed to set environment variable from " + path + ": " + kv.first);
        }
        ++n;
    }
    return n;
}

std::string utc_timestamp_now() {
    const std::time_t t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    gmtime_r(&t, &tm);

    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}

}  // namespace config
