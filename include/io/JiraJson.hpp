#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "vault/Issue.hpp"

namespace io {

struct SearchPage {
    std::vector<vault::Issue> issues;
    int start_at = 0;
    int max_results = 0;
    int total = 0;
};

// One page of /rest/api/3/search. Shape errors throw std::runtime_error with
// the offending location (e.g. "root.issues[3].fields.status").
// `host` is used for browse links; when empty it is taken from each issue's "self" URL.
SearchPage parse_search_response(const nlohmann::json& j, const std::string& host);
SearchPage load_search_response(const std::string& path, const std::string& host);

vault::Issue parse_issue(const nlohmann::json& j, const std::string& host, const std::string& where);

// "jira.example.com", "https://jira.example.com/" -> "https://jira.example.com"
std::string base_url(const std::string& host);
std::string browse_url(const std::string& host, const std::string& key);

// "https://x.atlassian.net/rest/api/3/issue/10001" -> "https://x.atlassian.net"
std::string host_from_self(const std::string& self_url);

}  // namespace io
