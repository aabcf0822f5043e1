#pragma once

#include <string>
#include <vector>

#include "vault/Issue.hpp"

namespace vault {

struct StatusGroup {
    std::string status;                 // exact status string, unnormalized
    std::vector<const Issue*> issues;   // input order
};

// Groups in order of first appearance of each status.
std::vector<StatusGroup> group_by_status(const std::vector<Issue>& issues);

// Obsidian Kanban board: one "## <status>" lane per group, one task line per issue.
std::string generate_board(const std::vector<Issue>& issues);

}  // namespace vault
