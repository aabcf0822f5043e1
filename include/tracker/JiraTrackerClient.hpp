#pragma once

#include "tracker/TrackerClient.hpp"

#include <string>
#include <vector>

namespace tracker {

struct JiraSettings {
    std::string host;
    std::string user;        // empty -> Bearer token auth
    std::string token;
    std::string jql;
    int page_size = 50;
};

// Jira REST v3 search over HTTPS, using the curl binary as transport.
class JiraTrackerClient final : public TrackerClient {
    JiraSettings settings_;

public:
    explicit JiraTrackerClient(JiraSettings settings);

    std::vector<vault::Issue> fetch_issues() override;
    std::string describe() const override;

    // Exposed for tests: the curl invocation for one page (no credentials in it).
    std::string search_command(const std::string& config_path, int start_at) const;

    // curl config file contents carrying the credentials.
    std::string curl_config() const;

private:
    std::string fetch_page(int start_at) const;
};

} // namespace tracker
