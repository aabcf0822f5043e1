#include "io/JiraJson.hpp"

#include "doc/AdfReader.hpp"

#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace io {

static void require_object(const json& j, const std::string& where) {
    if (!j.is_object()) {
        throw std::runtime_error(where + " must be an object");
    }
}

static const json& require_field(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key)) {
        throw std::runtime_error(where + " missing required field: " + std::string(key));
    }
    return j.at(key);
}

static std::string require_string(const json& j, const char* key, const std::string& where) {
    const json& v = require_field(j, key, where);
    if (!v.is_string()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be a string");
    }
    return v.get<std::string>();
}

static std::string optional_string(const json& j, const char* key) {
    if (!j.contains(key) || !j.at(key).is_string()) return "";
    return j.at(key).get<std::string>();
}

// {"name": "..."} objects (priority, issuetype); null or missing -> nullopt
static std::optional<std::string> optional_name(const json& fields, const char* key, const std::string& where) {
    if (!fields.contains(key) || fields.at(key).is_null()) return std::nullopt;
    const json& obj = fields.at(key);
    require_object(obj, where + "." + key);
    const std::string name = optional_string(obj, "name");
    if (name.empty()) return std::nullopt;
    return name;
}

static int int_or(const json& j, const char* key, int def) {
    if (!j.contains(key) || !j.at(key).is_number_integer()) return def;
    return j.at(key).get<int>();
}

std::string base_url(const std::string& host) {
    std::string b = host;
    if (b.rfind("http://", 0) != 0 && b.rfind("https://", 0) != 0) b = "https://" + b;
    while (!b.empty() && b.back() == '/') b.pop_back();
    return b;
}

std::string browse_url(const std::string& host, const std::string& key) {
    if (host.empty()) return "";
    return base_url(host) + "/browse/" + key;
}

std::string host_from_self(const std::string& self_url) {
    const size_t rest = self_url.find("/rest/");
    if (rest == std::string::npos) return "";
    return self_url.substr(0, rest);
}

vault::Issue parse_issue(const json& j, const std::string& host, const std::string& where) {
    require_object(j, where);

    vault::Issue issue;
    issue.key = require_string(j, "key", where);

    const json& fields = require_field(j, "fields", where);
    const std::string fw = where + ".fields";
    require_object(fields, fw);

    issue.summary = require_string(fields, "summary", fw);

    const json& status = require_field(fields, "status", fw);
    require_object(status, fw + ".status");
    issue.status = require_string(status, "name", fw + ".status");

    issue.priority   = optional_name(fields, "priority", fw);
    issue.issue_type = optional_name(fields, "issuetype", fw);
    issue.created    = optional_string(fields, "created");
    issue.updated    = optional_string(fields, "updated");

    if (fields.contains("description")) {
        const json& d = fields.at("description");
        if (d.is_string()) {
            issue.description = doc::read_plain_text(d.get<std::string>());
        } else if (!d.is_null()) {
            issue.description = doc::read_adf(d);
        }
    }

    const std::string link_host = host.empty() ? host_from_self(optional_string(j, "self")) : host;
    issue.link = browse_url(link_host, issue.key);

    return issue;
}

SearchPage parse_search_response(const json& j, const std::string& host) {
    require_object(j, "root");

    const json& issues = require_field(j, "issues", "root");
    if (!issues.is_array()) {
        throw std::runtime_error("root.issues must be an array");
    }

    SearchPage page;
    page.start_at    = int_or(j, "startAt", 0);
    page.max_results = int_or(j, "maxResults", static_cast<int>(issues.size()));

    page.issues.reserve(issues.size());
    for (size_t i = 0; i < issues.size(); ++i) {
        std::ostringstream oss;
        oss << "root.issues[" << i << "]";
        page.issues.push_back(parse_issue(issues.at(i), host, oss.str()));
    }

    page.total = int_or(j, "total", page.start_at + static_cast<int>(page.issues.size()));
    return page;
}

SearchPage load_search_response(const std::string& path, const std::string& host) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("failed to open issue export: " + path);
    }

    json j;
    try {
        in >> j;
    } catch (const std::exception& e) {
        throw std::runtime_error(std::string("failed to parse JSON: ") + e.what());
    }

    return parse_search_response(j, host);
}

}  // namespace io
