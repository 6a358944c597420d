#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <mediacat/core/types.h>

namespace mediacat::detection {

/**
 * @brief Result of sniffing one file
 */
struct MediaType {
    std::string mimeType; ///< normalized MIME type, e.g. "image/jpeg"
    bool supported = false;
    bool isVideo = false;
};

/**
 * @brief MIME sniffing for the supported image and video set
 *
 * Uses libmagic on the file's leading bytes. When libmagic cannot load its database, fails,
 * or only reports a generic type, the file extension decides.
 */
class MediaTypeDetector {
public:
    MediaTypeDetector();
    ~MediaTypeDetector();

    MediaTypeDetector(const MediaTypeDetector&) = delete;
    MediaTypeDetector& operator=(const MediaTypeDetector&) = delete;

    /**
     * @brief Sniff a file on disk
     * @return the detected type; FileNotFound/IOError when the file cannot be read
     */
    Result<MediaType> detect(const std::filesystem::path& path) const;

    // Extension lookup only; no I/O
    static MediaType fromExtension(const std::filesystem::path& path);

    static bool isSupportedMimeType(const std::string& mimeType);
    static bool isVideoMimeType(const std::string& mimeType);

    [[nodiscard]] bool hasLibMagic() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace mediacat::detection
