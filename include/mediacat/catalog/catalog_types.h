#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <mediacat/core/types.h>

namespace mediacat::catalog {

/**
 * @brief Audience of a WatchedRoot and of the change signals it produces
 *
 * Restricted (admin-only) listeners also see public changes.
 */
enum class VisibilityTier { Public, Restricted };

constexpr const char* tierToString(VisibilityTier tier) {
    return tier == VisibilityTier::Public ? "public" : "restricted";
}

Result<VisibilityTier> parseTier(std::string_view value);

// Public wins: a change that touches any public root must reach everyone
constexpr VisibilityTier moreVisible(VisibilityTier a, VisibilityTier b) {
    return (a == VisibilityTier::Public || b == VisibilityTier::Public) ? VisibilityTier::Public
                                                                        : VisibilityTier::Restricted;
}

struct WatchedRoot {
    int64_t id = 0;
    std::string path;
    std::string shortName;
    std::string description;
    bool ignored = false;
    VisibilityTier tier = VisibilityTier::Restricted;
    bool basepath = false;
    bool builtIn = false;
    std::string parent;
    std::vector<std::string> tags;
};

struct ContentRecord {
    Checksum checksum;
    bool isVideo = false;
    std::string metadataJson = "{}";
    std::optional<int> width;
    std::optional<int> height;
    int64_t dateCreated = 0;  ///< unix seconds, from the first-seen file
    int64_t dateModified = 0; ///< unix seconds, from the first-seen file
    int64_t dateIndexed = 0;  ///< unix seconds
};

struct LocationRecord {
    LocationId id = 0;
    Checksum checksum;
    std::string directory;
    std::string filename;
    int64_t dateScanned = 0;
    bool deleted = false;

    [[nodiscard]] std::filesystem::path fullPath() const {
        return std::filesystem::path(directory) / filename;
    }
};

/**
 * @brief Split an absolute file path into the (directory, filename) pair stored in locations
 */
std::pair<std::string, std::string> splitPath(const std::filesystem::path& path);

inline int64_t nowSeconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

} // namespace mediacat::catalog
