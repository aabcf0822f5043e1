#pragma once

#include <string>

#include "vault/Issue.hpp"

namespace vault {

// Fixed key order; every key is written even when its value is empty.
std::string build_frontmatter(const Issue& issue, const std::string& synced_at);

// YAML double-quoted scalar: backslash, quote and control characters escaped.
std::string yaml_quote(const std::string& value);

}  // namespace vault
