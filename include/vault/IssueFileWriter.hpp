#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "doc/MarkdownRenderer.hpp"
#include "vault/Issue.hpp"
#include "vault/SafeFileMerger.hpp"

namespace vault {

// Frontmatter + issue header + rendered description, ending in a blank line.
std::string render_issue_body(const Issue& issue, const std::string& synced_at,
                              doc::RenderReport* report = nullptr);

std::string render_issue_file(const Issue& issue, const std::optional<std::string>& existing,
                              const std::string& synced_at);

MergeResult render_issue_file_detailed(const Issue& issue, const std::optional<std::string>& existing,
                                       const std::string& synced_at, doc::RenderReport* report);

// "/", "\", ":" and control characters become "_". Empty keys are rejected.
std::string sanitize_file_name(const std::string& key);

// <root>/<issues_folder>/<key>.md
std::filesystem::path issue_file_path(const std::filesystem::path& root, const std::string& issues_folder,
                                      const std::string& key);

}  // namespace vault
