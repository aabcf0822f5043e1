#include "vault/FileStore.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <fstream>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace vault {

static fs::path temp_sibling(const fs::path& path) {
    static std::atomic<std::uint64_t> counter{0};
    const auto tick = std::chrono::steady_clock::now().time_since_epoch().count();
    const std::uint64_t n = counter.fetch_add(1U, std::memory_order_relaxed);
    return path.string() + ".tmp." + std::to_string(tick) + "." + std::to_string(n);
}

std::optional<std::string> read_existing(const fs::path& path) {
    std::error_code ec;
    const bool exists = fs::exists(path, ec);
    if (ec) throw FileStoreError("failed to stat " + path.string() + ": " + ec.message());
    if (!exists) return std::nullopt;

    if (fs::is_directory(path, ec)) throw FileStoreError("expected a file but found a directory: " + path.string());

    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in) throw FileStoreError("failed to open: " + path.string());

    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad()) throw FileStoreError("failed while reading: " + path.string());
    return ss.str();
}

void write_atomic(const fs::path& path, const std::string& content) {
    if (path.empty()) throw FileStoreError("output path cannot be empty");

    std::error_code ec;
    const fs::path parent = path.parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
        if (ec) throw FileStoreError("failed to create directory '" + parent.string() + "': " + ec.message());
    }

    const fs::path temp = temp_sibling(path);
    {
        std::ofstream out(temp, std::ios::out | std::ios::binary | std::ios::trunc);
        if (!out) throw FileStoreError("failed to open temp file '" + temp.string() + "'");

        out << content;
        out.flush();
        if (!out) {
            out.close();
            fs::remove(temp, ec);
            throw FileStoreError("failed while writing temp file '" + temp.string() + "'");
        }
    }

    // rename replaces the target in one step; on failure the target is untouched
    fs::rename(temp, path, ec);
    if (!ec) return;

    std::error_code cleanup_ec;
    fs::remove(temp, cleanup_ec);
    throw FileStoreError("failed to replace '" + path.string() + "': " + ec.message());
}

}  // namespace vault
