#pragma once

#include <string>
#include <filesystem>

namespace platform {

// Returns the user's home directory (HOME on Unix, USERPROFILE on Windows).
std::filesystem::path home_dir();

// Returns the system temporary directory (/tmp on Unix, GetTempPath on Windows).
std::filesystem::path temp_dir();

// Write `content` to `path` via a sibling temp file and rename, so readers
// never observe a half-written file. Returns false on I/O failure.
bool write_file_atomic(const std::filesystem::path& path, const std::string& content);

// Sleep for the given number of milliseconds.
void sleep_ms(int ms);

} // namespace platform
