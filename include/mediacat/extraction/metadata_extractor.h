#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <nlohmann/json.hpp>
#include <mediacat/detection/media_type_detector.h>

namespace mediacat::extraction {

/**
 * @brief Metadata derived from one media file
 *
 * `fields` always holds "mime_type". Every string value is valid UTF-8.
 */
struct ExtractedMetadata {
    nlohmann::json fields = nlohmann::json::object();
    std::optional<int> width;
    std::optional<int> height;

    // Nothing beyond the MIME type was recovered
    [[nodiscard]] bool empty() const;

    [[nodiscard]] std::string toJson() const;
};

/**
 * @brief Header-level facts parsed directly from an image's bytes
 */
struct ImageHeader {
    std::optional<int> width;
    std::optional<int> height;
    nlohmann::json fields = nlohmann::json::object();
};

struct MetadataExtractorConfig {
    std::string ffprobePath = "ffprobe";
    size_t maxParseBytes = 64 * 1024 * 1024;
};

/**
 * @brief Derives dimensions and embedded metadata for images and video
 *
 * Images are parsed in-process (PNG, JPEG, GIF, WebP, TIFF headers). Video, and images whose
 * header cannot be parsed, go through ffprobe. Extraction never fails: on any error the result
 * carries only the MIME type and null dimensions.
 */
class MetadataExtractor {
public:
    MetadataExtractor() = default;
    explicit MetadataExtractor(MetadataExtractorConfig config);

    ExtractedMetadata extract(const std::filesystem::path& path,
                              const detection::MediaType& type) const;

    static std::optional<ImageHeader> parseImage(std::span<const std::byte> data,
                                                 const std::string& mimeType);

    static std::optional<ImageHeader> parsePng(std::span<const std::byte> data);
    static std::optional<ImageHeader> parseJpeg(std::span<const std::byte> data);
    static std::optional<ImageHeader> parseGif(std::span<const std::byte> data);
    static std::optional<ImageHeader> parseWebp(std::span<const std::byte> data);
    static std::optional<ImageHeader> parseTiff(std::span<const std::byte> data);

    /**
     * @brief Query the first video stream's dimensions through ffprobe
     */
    Result<std::pair<int, int>> probeDimensions(const std::filesystem::path& path) const;

private:
    MetadataExtractorConfig config_;
};

} // namespace mediacat::extraction
