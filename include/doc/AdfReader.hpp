#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "doc/Document.hpp"

namespace doc {

// Atlassian Document Format -> Document. Never throws: anything that does not
// look like a known node becomes an Unknown node carrying its type name.
Document read_adf(const nlohmann::json& adf);

// Parses the JSON text first; unparseable input yields one Unknown node.
Document read_adf_string(const std::string& text);

// Plain-text descriptions (older REST API versions): blank lines separate
// paragraphs, single newlines become hard breaks.
Document read_plain_text(const std::string& text);

}  // namespace doc
