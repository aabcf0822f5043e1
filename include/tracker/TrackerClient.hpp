#pragma once
#include <string>
#include <vector>

#include "vault/Issue.hpp"

namespace tracker {

class TrackerClient {
public:
    virtual ~TrackerClient() = default;

    // Every issue matched by the configured query, in tracker order.
    // Throws std::runtime_error when the tracker cannot be reached or answers
    // with something that is not a search result; nothing is written then.
    virtual std::vector<vault::Issue> fetch_issues() = 0;

    virtual std::string describe() const = 0;
};

class NullTrackerClient final : public TrackerClient {
public:
    std::vector<vault::Issue> fetch_issues() override { return {}; }
    std::string describe() const override { return "null tracker"; }
};

} // namespace tracker
