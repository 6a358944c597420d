#include <spdlog/spdlog.h>
#include <mediacat/detection/media_type_detector.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>
#include <mutex>
#include <unordered_map>
#include <unordered_set>

#include <magic.h>

namespace mediacat::detection {

namespace {

constexpr size_t kSniffBytes = 4096;

const std::unordered_map<std::string, std::string> EXTENSION_MIME_MAP = {
    {".jpg", "image/jpeg"},       {".jpeg", "image/jpeg"},     {".jpe", "image/jpeg"},
    {".png", "image/png"},        {".gif", "image/gif"},       {".webp", "image/webp"},
    {".tif", "image/tiff"},       {".tiff", "image/tiff"},     {".heic", "image/heic"},
    {".heif", "image/heif"},      {".mp4", "video/mp4"},       {".m4v", "video/mp4"},
    {".mov", "video/quicktime"},  {".qt", "video/quicktime"},  {".avi", "video/x-msvideo"},
    {".webm", "video/webm"}};

// libmagic spells a few of these differently depending on version
const std::unordered_map<std::string, std::string> MIME_ALIASES = {
    {"image/pjpeg", "image/jpeg"},    {"image/x-png", "image/png"},
    {"image/x-tiff", "image/tiff"},   {"video/avi", "video/x-msvideo"},
    {"video/msvideo", "video/x-msvideo"}, {"image/heic-sequence", "image/heic"},
    {"image/heif-sequence", "image/heif"}, {"video/x-m4v", "video/mp4"}};

const std::unordered_set<std::string> SUPPORTED_MIME_TYPES = {
    "image/jpeg", "image/png",       "image/gif",       "image/webp",
    "image/tiff", "image/heic",      "image/heif",      "video/mp4",
    "video/quicktime", "video/x-msvideo", "video/webm"};

bool isGenericMimeType(const std::string& mime) {
    return mime.empty() || mime == "application/octet-stream" || mime == "text/plain" ||
           mime == "application/x-empty" || mime == "inode/x-empty";
}

std::string normalize(std::string mime) {
    std::transform(mime.begin(), mime.end(), mime.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (auto it = MIME_ALIASES.find(mime); it != MIME_ALIASES.end())
        return it->second;
    return mime;
}

MediaType classify(const std::string& mime) {
    MediaType type;
    type.mimeType = mime;
    type.supported = MediaTypeDetector::isSupportedMimeType(mime);
    type.isVideo = MediaTypeDetector::isVideoMimeType(mime);
    return type;
}

} // namespace

class MediaTypeDetector::Impl {
public:
    magic_t magicCookie = nullptr;
    mutable std::mutex magicMutex; // libmagic handles are not thread-safe

    Impl() {
        magicCookie = magic_open(MAGIC_MIME_TYPE | MAGIC_ERROR);
        if (!magicCookie) {
            spdlog::warn("Failed to initialize libmagic; using extension detection");
            return;
        }
        if (magic_load(magicCookie, nullptr) != 0) {
            spdlog::warn("Failed to load magic database: {}; using extension detection",
                         magic_error(magicCookie));
            magic_close(magicCookie);
            magicCookie = nullptr;
        }
    }

    ~Impl() {
        if (magicCookie) {
            std::lock_guard<std::mutex> lock(magicMutex);
            magic_close(magicCookie);
        }
    }

    std::string sniff(const char* data, size_t size) const {
        std::lock_guard<std::mutex> lock(magicMutex);
        if (!magicCookie)
            return {};
        const char* mime = magic_buffer(magicCookie, data, size);
        if (!mime) {
            spdlog::debug("libmagic detection failed: {}", magic_error(magicCookie));
            return {};
        }
        return mime;
    }
};

MediaTypeDetector::MediaTypeDetector() : pImpl(std::make_unique<Impl>()) {}

MediaTypeDetector::~MediaTypeDetector() = default;

Result<MediaType> MediaTypeDetector::detect(const std::filesystem::path& path) const {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        std::error_code ec;
        if (!std::filesystem::exists(path, ec))
            return Error{ErrorCode::FileNotFound, "File not found: " + path.string()};
        return Error{ErrorCode::IOError, "Cannot open file: " + path.string()};
    }

    std::array<char, kSniffBytes> buffer{};
    file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    const auto bytesRead = static_cast<size_t>(file.gcount());
    if (file.bad())
        return Error{ErrorCode::IOError, "Failed to read file: " + path.string()};

    std::string mime = bytesRead > 0 ? normalize(pImpl->sniff(buffer.data(), bytesRead)) : "";
    if (isGenericMimeType(mime))
        return fromExtension(path);

    MediaType type = classify(mime);
    if (!type.supported) {
        // Older magic databases miss some HEIF brands
        if (mime.rfind("image/", 0) != 0 && mime.rfind("video/", 0) != 0) {
            MediaType byExtension = fromExtension(path);
            if (byExtension.supported) {
                spdlog::debug("libmagic reported {} for {}, using extension ({})", mime,
                              path.string(), byExtension.mimeType);
                return byExtension;
            }
        }
    }
    return type;
}

MediaType MediaTypeDetector::fromExtension(const std::filesystem::path& path) {
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (auto it = EXTENSION_MIME_MAP.find(ext); it != EXTENSION_MIME_MAP.end())
        return classify(it->second);
    return classify("application/octet-stream");
}

bool MediaTypeDetector::isSupportedMimeType(const std::string& mimeType) {
    return SUPPORTED_MIME_TYPES.count(mimeType) > 0;
}

bool MediaTypeDetector::isVideoMimeType(const std::string& mimeType) {
    return mimeType.rfind("video/", 0) == 0;
}

bool MediaTypeDetector::hasLibMagic() const {
    return pImpl->magicCookie != nullptr;
}

} // namespace mediacat::detection
