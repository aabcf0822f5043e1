#include "vault/BoardGenerator.hpp"

#include "doc/MarkdownRenderer.hpp"
#include "vault/Markers.hpp"

#include <string>
#include <unordered_map>

namespace vault {

static std::string single_line(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (c == '\r') continue;
        out += (c == '\n') ? ' ' : c;
    }
    return out;
}

std::vector<StatusGroup> group_by_status(const std::vector<Issue>& issues) {
    std::vector<StatusGroup> groups;
    std::unordered_map<std::string, size_t> index;   // status -> position in groups
    index.reserve(issues.size() * 2 + 8);

    for (const auto& issue : issues) {
        auto it = index.find(issue.status);
        if (it == index.end()) {
            groups.push_back(StatusGroup{issue.status, {}});
            it = index.emplace(issue.status, groups.size() - 1).first;
        }
        groups[it->second].issues.push_back(&issue);
    }

    return groups;
}

std::string generate_board(const std::vector<Issue>& issues) {
    const std::string delim = FRONTMATTER_DELIMITER;

    std::string out = delim + "\nkanban-plugin: basic\n" + delim + "\n\n";

    for (const auto& group : group_by_status(issues)) {
        const std::string status = single_line(group.status);
        out += status.empty() ? "##\n\n" : "## " + status + "\n\n";

        for (const Issue* issue : group.issues) {
            out += "- [ ] [" + doc::escape_link_label(single_line(issue->key)) + "](" +
                   doc::link_destination(single_line(issue->link)) + ")";
            const std::string summary = single_line(issue->summary);
            if (!summary.empty()) out += " " + summary;
            out += "\n";
        }
        out += "\n";
    }

    return out;
}

}  // namespace vault
