#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <string>

namespace mediacat::config {

inline void ltrim(std::string& s) {
    s.erase(s.begin(),
            std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); }));
}

inline void rtrim(std::string& s) {
    s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); })
                .base(),
            s.end());
}

inline void trim(std::string& s) {
    ltrim(s);
    rtrim(s);
}

inline std::string unquote(std::string val) {
    trim(val);
    if (val.size() >= 2 && ((val.front() == '"' && val.back() == '"') ||
                            (val.front() == '\'' && val.back() == '\''))) {
        return val.substr(1, val.size() - 2);
    }
    return val;
}

inline std::filesystem::path expand_tilde(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            if (path.size() == 1)
                return std::filesystem::path(home);
            return std::filesystem::path(home) / path.substr(2);
        }
    }
    return path;
}

// $XDG_CONFIG_HOME/mediacat/config.toml or ~/.config/mediacat/config.toml
std::filesystem::path get_config_path(const std::string& override_path = "");

/// $XDG_DATA_HOME/mediacat or ~/.local/share/mediacat
std::filesystem::path get_data_dir();

/// $XDG_CACHE_HOME/mediacat or ~/.cache/mediacat
std::filesystem::path get_cache_dir();

} // namespace mediacat::config
