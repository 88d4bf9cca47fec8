#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace everos::core::config {

// Load environment variables from the first .env found (idempotent).
// Search roots: cwd, its two parents, $EVEROS_HOME, then extra_search_paths.
void load_dotenv(const std::vector<std::filesystem::path>& extra_search_paths = {});

// Load KEY=VALUE lines from a file. Existing variables are not overridden.
// Returns the number of variables set, 0 if the file cannot be read.
size_t load_env_file(const std::filesystem::path& path);

// Get environment variable, empty string if missing.
std::string get_env(const std::string& key);

// Get environment variable with default fallback.
std::string get_env_or(const std::string& key, const std::string& fallback);

// Integer variable; fallback when missing or not a number.
int64_t get_env_int(const std::string& key, int64_t fallback);

// Accepts 1/0, true/false, yes/no, on/off (case-insensitive).
bool get_env_bool(const std::string& key, bool fallback);

} // namespace everos::core::config
