#pragma once

#include "tracker/TrackerClient.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace tracker {

// Reads a saved /rest/api/3/search response instead of calling the tracker.
class ExportTrackerClient final : public TrackerClient {
    std::filesystem::path path_;
    std::string host_;

public:
    // host may be empty: links are then derived from each issue's "self" URL
    ExportTrackerClient(const std::string& path, const std::string& host);

    std::vector<vault::Issue> fetch_issues() override;
    std::string describe() const override;
};

} // namespace tracker
