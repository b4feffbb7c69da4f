#pragma once

#include <string>
#include <filesystem>

namespace platform {

// Returns the user's home directory (HOME on Unix, USERPROFILE on Windows).
std::filesystem::path home_dir();

// Returns the system temporary directory (/tmp on Unix, GetTempPath on Windows).
std::filesystem::path temp_dir();

// Returns a path inside `dir` named "<prefix>.<pid>.<random>.tmp" that did not
// exist at the time of the call. The file itself is not created.
std::filesystem::path unique_temp_path(const std::filesystem::path& dir,
                                       const std::string& prefix);

// Current process id.
int process_id();

// Sleep for the given number of milliseconds.
void sleep_ms(int ms);

} // namespace platform
