#pragma once

#include <string>
#include <filesystem>
#include <optional>

namespace platform {

// Returns the user's home directory (HOME, falling back to the temp dir).
std::filesystem::path home_dir();

// Returns the system temporary directory.
std::filesystem::path temp_dir();

// Value of an environment variable, nullopt when unset or empty.
std::optional<std::string> get_env(const char* name);

// Sleep for the given number of milliseconds.
void sleep_ms(int ms);

} // namespace platform
