#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <mediacat/core/types.h>

namespace mediacat::assets {

enum class AssetKind { Thumbnail, Preview };

// "thumb" / "preview": the kind token used in cache file names
constexpr const char* kindToString(AssetKind kind) {
    return kind == AssetKind::Thumbnail ? "thumb" : "preview";
}

Result<AssetKind> parseKind(std::string_view value);

struct RenderRequest {
    std::filesystem::path source;
    std::string mimeType;
    bool isVideo = false;
    int boundingSize = 400;
    std::filesystem::path output;
};

/**
 * @brief Produces one derived JPEG rendition of a media file
 */
class IAssetRenderer {
public:
    virtual ~IAssetRenderer() = default;

    /**
     * @brief Render `source` scaled to fit within boundingSize x boundingSize into `output`
     *
     * Aspect ratio is preserved and images are never upscaled. `output` is written in place;
     * publishing is the caller's job.
     */
    virtual Result<void> render(const RenderRequest& request) = 0;
};

struct JpegRendererConfig {
    std::string ffmpegPath = "ffmpeg";
    int quality = 85;
};

struct RgbImage {
    int width = 0;
    int height = 0;
    std::vector<uint8_t> pixels; ///< packed RGB, row-major
};

/**
 * @brief Renderer backed by libjpeg and stb_image for stills and ffmpeg for video
 *
 * JPEG sources are decoded with DCT-domain downscaling; PNG, GIF and BMP stills go through
 * stb_image. Both are resampled with stb_image_resize and encoded with libjpeg. Video frames, and
 * stills neither decoder accepts (WebP, HEIF), are captured by an external ffmpeg process.
 */
class JpegAssetRenderer : public IAssetRenderer {
public:
    JpegAssetRenderer() = default;
    explicit JpegAssetRenderer(JpegRendererConfig config);

    Result<void> render(const RenderRequest& request) override;

    Result<void> renderJpeg(const RenderRequest& request) const;
    Result<void> renderImage(const RenderRequest& request) const;
    Result<void> renderWithFfmpeg(const RenderRequest& request) const;

private:
    Result<void> scaleAndEncode(const RgbImage& image, const RenderRequest& request) const;

    JpegRendererConfig config_;
};

// Fit (width, height) inside a square of `bound` without upscaling
std::pair<int, int> fitWithin(int width, int height, int bound);

// Resample with stb_image_resize
Result<RgbImage> resizeImage(const RgbImage& source, int width, int height);

// Any still stb_image understands (PNG, GIF, BMP, JPEG), as RGB
Result<RgbImage> decodeImage(const std::filesystem::path& path);

// Decode at the smallest DCT scale that still covers fitWithin(w, h, bound)
Result<RgbImage> decodeJpeg(const std::filesystem::path& path, int bound);
Result<void> encodeJpeg(const RgbImage& image, const std::filesystem::path& path, int quality);

} // namespace mediacat::assets
