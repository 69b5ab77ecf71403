#pragma once

#include <filesystem>
#include <string>

namespace Common {

// Replace `path` by writing `contents` to a temp file in the same directory and
// renaming it into place. Readers observe either the old file or the new one.
// On POSIX the file ends up with owner-only permissions.
bool AtomicWriteFile(const std::filesystem::path& path, const std::string& contents,
                     std::string* error = nullptr);

// Reads a whole file. Returns false when it cannot be opened.
bool ReadFileToString(const std::filesystem::path& path, std::string& out);

} // namespace Common
