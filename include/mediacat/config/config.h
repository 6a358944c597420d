#pragma once

#include <chrono>
#include <filesystem>
#include <istream>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <mediacat/catalog/catalog_types.h>

namespace mediacat::config {

struct ConfiguredRoot {
    std::string path;
    catalog::VisibilityTier tier = catalog::VisibilityTier::Public;
};

struct MediacatConfig {
    struct Core {
        std::filesystem::path dataDir;
        std::filesystem::path cacheDir;
        std::string logLevel = "info";
        std::optional<std::filesystem::path> logFile;
    } core;

    struct Assets {
        int thumbnailSize = 400;
        int previewSize = 1024;
        int workers = 4;
        int jpegQuality = 85;
        std::string ffmpeg = "ffmpeg";
        std::string ffprobe = "ffprobe";
    } assets;

    struct Notify {
        std::chrono::milliseconds debounce{1500};
    } notify;

    struct Database {
        std::chrono::milliseconds busyTimeout{5000};
        int maxConnections = 8;
    } database;

    std::vector<ConfiguredRoot> roots;

    [[nodiscard]] std::filesystem::path databasePath() const { return core.dataDir / "catalog.db"; }
};

// Flat "section.key" -> unquoted value map; keys inside [roots] keep their quoted path verbatim
using FlatConfig = std::map<std::string, std::string>;

FlatConfig parseTomlFlat(std::istream& in);

/**
 * @brief Build a configuration from parsed values, defaults and environment overrides
 *
 * Fails with InvalidArgument on an unknown tier, a non-numeric or non-positive size, or a
 * relative root path.
 */
Result<MediacatConfig> buildConfig(const FlatConfig& values);

/**
 * @brief Load the configuration file
 *
 * Lookup order: `overridePath`, MEDIACAT_CONFIG, then the XDG config location. A missing file
 * yields the defaults.
 */
Result<MediacatConfig> loadConfig(const std::string& overridePath = "");

} // namespace mediacat::config
