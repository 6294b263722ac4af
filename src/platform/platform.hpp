#pragma once

#include <string>
#include <filesystem>

namespace platform {

// Returns the system temporary directory (/tmp on Unix, GetTempPath on Windows).
std::filesystem::path temp_dir();

// Returns a unique, not-yet-created path in the temp directory with the given prefix.
std::filesystem::path temp_file(const std::string& prefix);

// Sleep for the given number of milliseconds. Zero or negative returns immediately.
void sleep_ms(int ms);

} // namespace platform
