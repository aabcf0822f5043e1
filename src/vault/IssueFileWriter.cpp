#include "vault/IssueFileWriter.hpp"

#include "vault/Frontmatter.hpp"

#include <stdexcept>
#include <string>

namespace vault {

static const char* NO_DESCRIPTION = "No description provided.\n";

static std::string single_line(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (c == '\r') continue;
        out += (c == '\n' || c == '\t') ? ' ' : c;
    }
    return out;
}

static std::string issue_header(const Issue& issue) {
    std::string h = "# " + issue.key;
    const std::string summary = single_line(issue.summary);
    if (!summary.empty()) h += " " + summary;
    h += "\n\n";

    h += "**Type**: " + single_line(issue.issue_type.value_or("None")) + "\n";
    h += "**Priority**: " + single_line(issue.priority.value_or("None")) + "\n";
    h += "**Status**: " + single_line(issue.status) + "\n";
    h += "\n## Description\n\n";
    return h;
}

std::string render_issue_body(const Issue& issue, const std::string& synced_at, doc::RenderReport* report) {
    std::string description;
    if (issue.description) description = doc::render_markdown(*issue.description, report);
    if (description.find_first_not_of(" \t\n") == std::string::npos) description = NO_DESCRIPTION;

    return build_frontmatter(issue, synced_at) + issue_header(issue) + description + "\n";
}

MergeResult render_issue_file_detailed(const Issue& issue, const std::optional<std::string>& existing,
                                       const std::string& synced_at, doc::RenderReport* report) {
    return merge_notes_detailed(existing, render_issue_body(issue, synced_at, report));
}

std::string render_issue_file(const Issue& issue, const std::optional<std::string>& existing,
                              const std::string& synced_at) {
    return render_issue_file_detailed(issue, existing, synced_at, nullptr).content;
}

std::string sanitize_file_name(const std::string& key) {
    if (key.empty()) throw std::runtime_error("issue key is empty");

    std::string out;
    out.reserve(key.size());
    for (unsigned char c : key) {
        const bool bad = c < 0x20 || c == 0x7f || c == '/' || c == '\\' || c == ':';
        out += bad ? '_' : static_cast<char>(c);
    }
    if (out == "." || out == "..") out = "_" + out;
    return out;
}

std::filesystem::path issue_file_path(const std::filesystem::path& root, const std::string& issues_folder,
                                      const std::string& key) {
    return root / issues_folder / (sanitize_file_name(key) + ".md");
}

}  // namespace vault
