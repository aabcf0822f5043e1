#pragma once

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>

namespace vault {

class FileStoreError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Prior content of a target file, byte-exact. nullopt when the file does not
// exist; FileStoreError when it exists but cannot be read.
std::optional<std::string> read_existing(const std::filesystem::path& path);

// Writes the full content to a temporary sibling and renames it over the
// target, so readers see either the old file or the new one. Creates parent
// directories. Throws FileStoreError; the target is left as it was.
void write_atomic(const std::filesystem::path& path, const std::string& content);

}  // namespace vault
