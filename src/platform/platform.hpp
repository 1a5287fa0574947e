#pragma once

#include <string>
#include <optional>
#include <filesystem>

namespace platform {

// Returns the user's home directory (HOME), or the temp dir when unset.
std::filesystem::path home_dir();

// Returns the system temporary directory.
std::filesystem::path temp_dir();

// Sleep for the given number of milliseconds.
void sleep_ms(int ms);

// Search PATH for an executable. A name containing '/' is checked as-is.
std::optional<std::filesystem::path> find_executable(const std::string& name);

} // namespace platform
