#include "vault/Frontmatter.hpp"

#include "vault/Markers.hpp"

#include <cstdio>
#include <string>

namespace vault {

std::string yaml_quote(const std::string& value) {
    std::string out = "\"";
    out.reserve(value.size() + 2);
    for (unsigned char c : value) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '"':  out += "\\\""; break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            default:
                if (c < 0x20 || c == 0x7f) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\x%02x", c);
                    out += buf;
                } else {
                    out += static_cast<char>(c);
                }
                break;
        }
    }
    out += "\"";
    return out;
}

std::string build_frontmatter(const Issue& issue, const std::string& synced_at) {
    const std::string delim = FRONTMATTER_DELIMITER;

    std::string out = delim + "\n";
    auto field = [&](const char* key, const std::string& value) {
        out += key;
        out += ": ";
        out += yaml_quote(value);
        out += "\n";
    };

    field("jira_key", issue.key);
    field("jira_status", issue.status);
    field("jira_priority", issue.priority.value_or(""));
    field("jira_type", issue.issue_type.value_or(""));
    field("jira_url", issue.link);
    field("created_at", issue.created);
    field("updated_at", issue.updated);
    field("synced_at", synced_at);

    out += delim + "\n";
    return out;
}

}  // namespace vault
