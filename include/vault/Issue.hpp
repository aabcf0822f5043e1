#pragma once

#include <optional>
#include <string>

#include "doc/Document.hpp"

namespace vault {

struct Issue {
    std::string key;                              // unique, stable; also the file name
    std::string summary;
    std::string status;                           // free-form, drives board grouping
    std::optional<std::string> priority;
    std::optional<std::string> issue_type;        // Task / Bug / Story ...
    std::optional<doc::Document> description;
    std::string link;                             // browse URL of the source record
    std::string created;
    std::string updated;
};

}  // namespace vault
