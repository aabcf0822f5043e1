#include "tracker/ExportTrackerClient.hpp"

#include "io/JiraJson.hpp"

namespace tracker {

ExportTrackerClient::ExportTrackerClient(const std::string& path, const std::string& host)
    : path_(path), host_(host) {}

std::vector<vault::Issue> ExportTrackerClient::fetch_issues() {
    return io::load_search_response(path_.string(), host_).issues;
}

std::string ExportTrackerClient::describe() const {
    return "export " + path_.string();
}

} // namespace tracker
