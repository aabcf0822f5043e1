#include "tracker/JiraTrackerClient.hpp"

#include "io/JiraJson.hpp"
#include "tracker/ProcUtil.hpp"

#include <nlohmann/json.hpp>

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <sstream>
#include <stdexcept>
#include <unistd.h>
#include <utility>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace tracker {

static const char* SEARCH_FIELDS = "key,summary,description,status,created,updated,priority,issuetype";

// curl config values are double-quoted; backslash and quote need escaping
static std::string curl_config_quote(const std::string& s) {
    std::string o = "\"";
    for (char c : s) {
        switch (c) {
            case '\\': o += "\\\\"; break;
            case '"':  o += "\\\""; break;
            case '\n': o += "\\n";  break;
            case '\r': o += "\\r";  break;
            default:   o += c;      break;
        }
    }
    o += "\"";
    return o;
}

// Owns a 0600 temp file holding credentials; removed on scope exit.
class SecretFile {
    std::string path_;

public:
    explicit SecretFile(const std::string& content) {
        std::string tmpl = (fs::temp_directory_path() / "issue-vault-curl-XXXXXX").string();
        const int fd = mkstemp(tmpl.data());
        if (fd < 0) throw std::runtime_error("failed to create temp curl config");
        path_ = tmpl;   // mkstemp creates the file with mode 0600

        size_t off = 0;
        while (off < content.size()) {
            const ssize_t n = ::write(fd, content.data() + off, content.size() - off);
            if (n <= 0) {
                ::close(fd);
                std::remove(path_.c_str());
                throw std::runtime_error("failed to write temp curl config");
            }
            off += static_cast<size_t>(n);
        }
        ::close(fd);
    }

    ~SecretFile() { std::remove(path_.c_str()); }

    SecretFile(const SecretFile&) = delete;
    SecretFile& operator=(const SecretFile&) = delete;

    const std::string& path() const { return path_; }
};

JiraTrackerClient::JiraTrackerClient(JiraSettings settings) : settings_(std::move(settings)) {
    if (settings_.page_size <= 0) settings_.page_size = 50;
}

std::string JiraTrackerClient::describe() const {
    return "Jira " + io::base_url(settings_.host);
}

std::string JiraTrackerClient::curl_config() const {
    std::ostringstream c;
    c << "header = " << curl_config_quote("Accept: application/json") << "\n";
    if (!settings_.user.empty()) {
        c << "user = " << curl_config_quote(settings_.user + ":" + settings_.token) << "\n";
    } else {
        c << "header = " << curl_config_quote("Authorization: Bearer " + settings_.token) << "\n";
    }
    return c.str();
}

std::string JiraTrackerClient::search_command(const std::string& config_path, int start_at) const {
    using procutil::shell_quote;

    std::ostringstream cmd;
    cmd << "curl -sS -G"
        << " -K " << shell_quote(config_path)
        << " -w " << shell_quote("\n%{http_code}")
        << " --data-urlencode " << shell_quote("jql=" + settings_.jql)
        << " --data-urlencode " << shell_quote(std::string("fields=") + SEARCH_FIELDS)
        << " --data-urlencode " << shell_quote("startAt=" + std::to_string(start_at))
        << " --data-urlencode " << shell_quote("maxResults=" + std::to_string(settings_.page_size))
        << " " << shell_quote(io::base_url(settings_.host) + "/rest/api/3/search");
    return cmd.str();
}

std::string JiraTrackerClient::fetch_page(int start_at) const {
    SecretFile config(curl_config());

    const procutil::ProcResult r = procutil::run_capture_stdout(search_command(config.path(), start_at));
    if (r.exit_code != 0) {
        throw std::runtime_error("curl failed with exit code " + std::to_string(r.exit_code) +
                                 " while querying " + io::base_url(settings_.host));
    }

    // body, then "\n<http status>" appended by -w
    const size_t nl = r.output.rfind('\n');
    if (nl == std::string::npos) {
        throw std::runtime_error("unexpected response from curl (no HTTP status)");
    }
    const std::string body = r.output.substr(0, nl);
    const std::string code = r.output.substr(nl + 1);

    if (code.empty() || code[0] != '2') {
        throw std::runtime_error("Jira API error (HTTP " + code + "): " + body);
    }
    return body;
}

std::vector<vault::Issue> JiraTrackerClient::fetch_issues() {
    std::vector<vault::Issue> out;

    int start_at = 0;
    while (true) {
        const std::string body = fetch_page(start_at);

        json j;
        try {
            j = json::parse(body);
        } catch (const std::exception& e) {
            throw std::runtime_error(std::string("failed to parse Jira response: ") + e.what());
        }

        io::SearchPage page = io::parse_search_response(j, settings_.host);
        if (page.issues.empty()) break;

        start_at = page.start_at + static_cast<int>(page.issues.size());
        for (auto& issue : page.issues) out.push_back(std::move(issue));

        if (start_at >= page.total) break;
    }

    return out;
}

} // namespace tracker
