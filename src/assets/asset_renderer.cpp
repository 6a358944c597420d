#define STB_IMAGE_IMPLEMENTATION
#define STB_IMAGE_RESIZE_IMPLEMENTATION

#include <spdlog/spdlog.h>
#include <mediacat/assets/asset_renderer.h>
#include <mediacat/core/process.h>

#include <algorithm>
#include <csetjmp>
#include <cstdio>
#include <memory>

#include <jpeglib.h>
#include <stb/stb_image.h>
#include <stb/stb_image_resize.h>

namespace mediacat::assets {

namespace {

struct JpegErrorManager {
    jpeg_error_mgr pub;
    std::jmp_buf jump;
    char message[JMSG_LENGTH_MAX];
};

void jpegErrorExit(j_common_ptr cinfo) {
    auto* err = reinterpret_cast<JpegErrorManager*>(cinfo->err);
    (*cinfo->err->format_message)(cinfo, err->message);
    std::longjmp(err->jump, 1);
}

void jpegOutputMessage(j_common_ptr cinfo) {
    char buffer[JMSG_LENGTH_MAX];
    (*cinfo->err->format_message)(cinfo, buffer);
    spdlog::debug("libjpeg: {}", buffer);
}

struct FileCloser {
    void operator()(FILE* f) const {
        if (f)
            std::fclose(f);
    }
};
using FilePtr = std::unique_ptr<FILE, FileCloser>;

} // namespace

Result<AssetKind> parseKind(std::string_view value) {
    if (value == "thumb" || value == "thumbnail")
        return AssetKind::Thumbnail;
    if (value == "preview")
        return AssetKind::Preview;
    return Error{ErrorCode::InvalidArgument, "Unknown asset kind: " + std::string(value)};
}

std::pair<int, int> fitWithin(int width, int height, int bound) {
    if (width <= 0 || height <= 0 || bound <= 0)
        return {0, 0};
    if (width <= bound && height <= bound)
        return {width, height};
    const double scale = std::min(static_cast<double>(bound) / width,
                                  static_cast<double>(bound) / height);
    return {std::max(1, static_cast<int>(width * scale + 0.5)),
            std::max(1, static_cast<int>(height * scale + 0.5))};
}

Result<RgbImage> resizeImage(const RgbImage& source, int width, int height) {
    if (width == source.width && height == source.height)
        return source;
    if (width <= 0 || height <= 0 || source.width <= 0 || source.height <= 0)
        return Error{ErrorCode::InvalidArgument, "Invalid resize dimensions"};

    RgbImage out;
    out.width = width;
    out.height = height;
    out.pixels.resize(static_cast<size_t>(width) * height * 3);
    if (!stbir_resize_uint8(source.pixels.data(), source.width, source.height, 0,
                            out.pixels.data(), width, height, 0, 3))
        return Error{ErrorCode::InternalError, "stb_image_resize failed"};
    return out;
}

Result<RgbImage> decodeImage(const std::filesystem::path& path) {
    int width = 0, height = 0, channels = 0;
    unsigned char* data = stbi_load(path.c_str(), &width, &height, &channels, 3);
    if (!data) {
        const char* reason = stbi_failure_reason();
        return Error{ErrorCode::InvalidData, "Failed to decode " + path.string() + ": " +
                                                 (reason ? reason : "unknown error")};
    }

    RgbImage image;
    image.width = width;
    image.height = height;
    image.pixels.assign(data, data + static_cast<size_t>(width) * height * 3);
    stbi_image_free(data);
    return image;
}

namespace {

// setjmp lives in these frames; every object libjpeg touches belongs to the caller
bool runDecompress(jpeg_decompress_struct* cinfo, JpegErrorManager* jerr, FILE* file, int bound,
                   RgbImage* image) {
    if (setjmp(jerr->jump)) {
        jpeg_destroy_decompress(cinfo);
        return false;
    }

    jpeg_create_decompress(cinfo);
    jpeg_stdio_src(cinfo, file);
    jpeg_read_header(cinfo, TRUE);

    const auto target = fitWithin(static_cast<int>(cinfo->image_width),
                                  static_cast<int>(cinfo->image_height), bound);
    cinfo->scale_num = 1;
    cinfo->scale_denom = 1;
    for (unsigned denom : {8u, 4u, 2u}) {
        const unsigned scaledW = (cinfo->image_width + denom - 1) / denom;
        const unsigned scaledH = (cinfo->image_height + denom - 1) / denom;
        if (static_cast<int>(scaledW) >= target.first &&
            static_cast<int>(scaledH) >= target.second) {
            cinfo->scale_denom = denom;
            break;
        }
    }
    cinfo->out_color_space = JCS_RGB;

    jpeg_start_decompress(cinfo);
    image->width = static_cast<int>(cinfo->output_width);
    image->height = static_cast<int>(cinfo->output_height);
    image->pixels.resize(static_cast<size_t>(image->width) * image->height * 3);

    while (cinfo->output_scanline < cinfo->output_height) {
        JSAMPROW row = image->pixels.data() +
                       static_cast<size_t>(cinfo->output_scanline) * image->width * 3;
        jpeg_read_scanlines(cinfo, &row, 1);
    }
    jpeg_finish_decompress(cinfo);
    jpeg_destroy_decompress(cinfo);
    return true;
}

bool runCompress(jpeg_compress_struct* cinfo, JpegErrorManager* jerr, FILE* file,
                 const RgbImage& image, int quality) {
    if (setjmp(jerr->jump)) {
        jpeg_destroy_compress(cinfo);
        return false;
    }

    jpeg_create_compress(cinfo);
    jpeg_stdio_dest(cinfo, file);
    cinfo->image_width = static_cast<JDIMENSION>(image.width);
    cinfo->image_height = static_cast<JDIMENSION>(image.height);
    cinfo->input_components = 3;
    cinfo->in_color_space = JCS_RGB;
    jpeg_set_defaults(cinfo);
    jpeg_set_quality(cinfo, std::clamp(quality, 1, 100), TRUE);
    jpeg_start_compress(cinfo, TRUE);

    while (cinfo->next_scanline < cinfo->image_height) {
        auto* row = const_cast<JSAMPLE*>(image.pixels.data() +
                                         static_cast<size_t>(cinfo->next_scanline) * image.width * 3);
        jpeg_write_scanlines(cinfo, &row, 1);
    }
    jpeg_finish_compress(cinfo);
    jpeg_destroy_compress(cinfo);
    return true;
}

} // namespace

Result<RgbImage> decodeJpeg(const std::filesystem::path& path, int bound) {
    FilePtr file(std::fopen(path.c_str(), "rb"));
    if (!file)
        return Error{ErrorCode::FileNotFound, "Cannot open " + path.string()};

    RgbImage image;
    jpeg_decompress_struct cinfo{};
    JpegErrorManager jerr{};
    cinfo.err = jpeg_std_error(&jerr.pub);
    jerr.pub.error_exit = jpegErrorExit;
    jerr.pub.output_message = jpegOutputMessage;

    if (!runDecompress(&cinfo, &jerr, file.get(), bound, &image))
        return Error{ErrorCode::InvalidData,
                     "JPEG decode failed for " + path.string() + ": " + jerr.message};
    return image;
}

Result<void> encodeJpeg(const RgbImage& image, const std::filesystem::path& path, int quality) {
    FilePtr file(std::fopen(path.c_str(), "wb"));
    if (!file)
        return Error{ErrorCode::IOError, "Cannot create " + path.string()};

    jpeg_compress_struct cinfo{};
    JpegErrorManager jerr{};
    cinfo.err = jpeg_std_error(&jerr.pub);
    jerr.pub.error_exit = jpegErrorExit;
    jerr.pub.output_message = jpegOutputMessage;

    if (!runCompress(&cinfo, &jerr, file.get(), image, quality))
        return Error{ErrorCode::IOError,
                     "JPEG encode failed for " + path.string() + ": " + jerr.message};

    if (std::fflush(file.get()) != 0)
        return Error{ErrorCode::IOError, "Failed to flush " + path.string()};
    return {};
}

JpegAssetRenderer::JpegAssetRenderer(JpegRendererConfig config) : config_(std::move(config)) {}

Result<void> JpegAssetRenderer::render(const RenderRequest& request) {
    if (request.isVideo)
        return renderWithFfmpeg(request);

    // stb_image has no WebP or HEIF decoder; those formats fall through to ffmpeg
    auto result = request.mimeType == "image/jpeg" ? renderJpeg(request) : renderImage(request);
    if (result)
        return result;
    spdlog::debug("In-process decode of {} ({}) failed: {}; trying ffmpeg",
                  request.source.string(), request.mimeType, result.error().message);
    return renderWithFfmpeg(request);
}

Result<void> JpegAssetRenderer::renderJpeg(const RenderRequest& request) const {
    auto decoded = decodeJpeg(request.source, request.boundingSize);
    if (!decoded)
        return decoded.error();
    return scaleAndEncode(decoded.value(), request);
}

Result<void> JpegAssetRenderer::renderImage(const RenderRequest& request) const {
    auto decoded = decodeImage(request.source);
    if (!decoded)
        return decoded.error();
    return scaleAndEncode(decoded.value(), request);
}

Result<void> JpegAssetRenderer::scaleAndEncode(const RgbImage& image,
                                               const RenderRequest& request) const {
    const auto [width, height] = fitWithin(image.width, image.height, request.boundingSize);
    if (width == 0 || height == 0)
        return Error{ErrorCode::InvalidData, "Empty image: " + request.source.string()};

    auto resized = resizeImage(image, width, height);
    if (!resized)
        return resized.error();
    return encodeJpeg(resized.value(), request.output, config_.quality);
}

Result<void> JpegAssetRenderer::renderWithFfmpeg(const RenderRequest& request) const {
    const std::string bound = std::to_string(request.boundingSize);
    // ffmpeg's -q:v runs 2 (best) to 31
    const int qscale = std::clamp(2 + (100 - config_.quality) * 29 / 100, 2, 31);

    std::vector<std::string> argv = {config_.ffmpegPath, "-y", "-loglevel", "error"};
    if (request.isVideo) {
        argv.insert(argv.end(), {"-ss", "00:00:00.001"});
    }
    argv.insert(argv.end(),
                {"-i", request.source.string(), "-vframes", "1", "-vf",
                 "scale='min(iw," + bound + ")':'min(ih," + bound +
                     ")':force_original_aspect_ratio=decrease",
                 "-q:v", std::to_string(qscale), "-f", "mjpeg", request.output.string()});

    auto result = runProcess(argv);
    if (!result)
        return Error{ErrorCode::ExternalToolFailed, "ffmpeg failed for " +
                                                        request.source.string() + ": " +
                                                        result.error().message};

    std::error_code ec;
    if (!std::filesystem::exists(request.output, ec) ||
        std::filesystem::file_size(request.output, ec) == 0)
        return Error{ErrorCode::ExternalToolFailed,
                     "ffmpeg produced no output for " + request.source.string()};
    return {};
}

} // namespace mediacat::assets
