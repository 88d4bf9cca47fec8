#include "core/config.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <spdlog/spdlog.h>

namespace everos::core::config {

namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return {};
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::vector<std::filesystem::path> dotenv_search_roots() {
    std::vector<std::filesystem::path> roots;
    std::error_code ec;
    auto cwd = std::filesystem::current_path(ec);
    if (!ec) {
        roots.push_back(cwd);
        roots.push_back(cwd.parent_path());
        roots.push_back(cwd.parent_path().parent_path());
    }

    auto home = get_env("EVEROS_HOME");
    if (!home.empty()) {
        roots.emplace_back(home);
    }
    return roots;
}

} // namespace

size_t load_env_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        return 0;
    }

    size_t loaded = 0;
    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;

        if (line.rfind("export ", 0) == 0) {
            line = trim(line.substr(7));
        }

        size_t eq_pos = line.find('=');
        if (eq_pos == std::string::npos) continue;

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        if (value.size() >= 2) {
            if ((value.front() == '"' && value.back() == '"') ||
                (value.front() == '\'' && value.back() == '\'')) {
                value = value.substr(1, value.size() - 2);
            }
        }

        if (!key.empty() && std::getenv(key.c_str()) == nullptr) {
            setenv(key.c_str(), value.c_str(), 0);
            ++loaded;
        }
    }
    return loaded;
}

void load_dotenv(const std::vector<std::filesystem::path>& extra_search_paths) {
    static bool loaded = false;
    if (loaded) return;
    loaded = true;

    auto search_paths = dotenv_search_roots();
    search_paths.insert(search_paths.end(), extra_search_paths.begin(), extra_search_paths.end());

    for (const auto& base : search_paths) {
        auto env_path = base / ".env";
        std::error_code ec;
        if (!std::filesystem::exists(env_path, ec)) {
            continue;
        }
        size_t count = load_env_file(env_path);
        spdlog::debug("Loaded {} variable(s) from {}", count, env_path.string());
        break;
    }
}

std::string get_env(const std::string& key) {
    const char* value = std::getenv(key.c_str());
    return value ? std::string(value) : std::string();
}

std::string get_env_or(const std::string& key, const std::string& fallback) {
    auto value = get_env(key);
    return value.empty() ? fallback : value;
}

int64_t get_env_int(const std::string& key, int64_t fallback) {
    auto value = trim(get_env(key));
    if (value.empty()) {
        return fallback;
    }

    try {
        size_t consumed = 0;
        int64_t parsed = std::stoll(value, &consumed);
        if (consumed != value.size()) {
            spdlog::warn("Ignoring {}={}: not an integer", key, value);
            return fallback;
        }
        return parsed;
    } catch (const std::exception&) {
        spdlog::warn("Ignoring {}={}: not an integer", key, value);
        return fallback;
    }
}

bool get_env_bool(const std::string& key, bool fallback) {
    auto value = trim(get_env(key));
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (value == "1" || value == "true" || value == "yes" || value == "on") return true;
    if (value == "0" || value == "false" || value == "no" || value == "off") return false;
    return fallback;
}

} // namespace everos::core::config
