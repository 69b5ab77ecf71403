#include "../include/Common/AtomicFile.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <fstream>
#include <sstream>
#include <system_error>

namespace Common {

namespace {

std::atomic<std::uint64_t> g_tempCounter{0};

std::filesystem::path MakeTempPath(const std::filesystem::path& target) {
    const auto nonce = g_tempCounter.fetch_add(1, std::memory_order_relaxed);
    const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
    std::string tmpName =
        target.filename().string() + ".tmp." + std::to_string(now) + "." + std::to_string(nonce);
    return target.parent_path() / tmpName;
}

void SetError(std::string* error, const std::string& message) {
    if (error) {
        *error = message;
    }
}

}  // namespace

bool AtomicWriteFile(const std::filesystem::path& path, const std::string& contents,
                     std::string* error) {
    std::error_code ec;
    const auto parent = path.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            SetError(error, "create_directories failed: " + ec.message());
            return false;
        }
    }

    const auto tmpPath = MakeTempPath(path);
    {
        std::ofstream out(tmpPath, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            SetError(error, "failed to open temp file for write");
            return false;
        }
        out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
        out.flush();
        if (!out) {
            out.close();
            std::filesystem::remove(tmpPath, ec);
            SetError(error, "failed to write temp file");
            return false;
        }
    }

#ifndef _WIN32
    std::filesystem::permissions(tmpPath,
                                 std::filesystem::perms::owner_read |
                                     std::filesystem::perms::owner_write,
                                 std::filesystem::perm_options::replace, ec);
    ec.clear();
#endif

    std::filesystem::rename(tmpPath, path, ec);
    if (ec) {
        std::error_code removeEc;
        std::filesystem::remove(tmpPath, removeEc);
        SetError(error, "rename failed: " + ec.message());
        return false;
    }
    return true;
}

bool ReadFileToString(const std::filesystem::path& path, std::string& out) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return false;
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    out = buffer.str();
    return true;
}

} // namespace Common
