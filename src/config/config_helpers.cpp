#include <mediacat/config/config_helpers.h>

namespace mediacat::config {

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }

    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    const char* homeEnv = std::getenv("HOME");

    std::filesystem::path configHome;
    if (xdgConfigHome && *xdgConfigHome) {
        configHome = std::filesystem::path(xdgConfigHome);
    } else if (homeEnv) {
        configHome = std::filesystem::path(homeEnv) / ".config";
    } else {
        return std::filesystem::path("~/.config") / "mediacat" / "config.toml";
    }

    return configHome / "mediacat" / "config.toml";
}

std::filesystem::path get_data_dir() {
    if (const char* xdg_data = std::getenv("XDG_DATA_HOME"); xdg_data && *xdg_data) {
        return std::filesystem::path(xdg_data) / "mediacat";
    }
    if (const char* home = std::getenv("HOME")) {
        return std::filesystem::path(home) / ".local" / "share" / "mediacat";
    }
    return std::filesystem::current_path() / "mediacat_data";
}

std::filesystem::path get_cache_dir() {
    if (const char* xdg_cache = std::getenv("XDG_CACHE_HOME"); xdg_cache && *xdg_cache) {
        return std::filesystem::path(xdg_cache) / "mediacat";
    }
    if (const char* home = std::getenv("HOME")) {
        return std::filesystem::path(home) / ".cache" / "mediacat";
    }
    return std::filesystem::current_path() / "mediacat_cache";
}

} // namespace mediacat::config
