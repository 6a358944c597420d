#include <spdlog/spdlog.h>
#include <mediacat/core/process.h>
#include <mediacat/core/utf8.h>
#include <mediacat/extraction/metadata_extractor.h>

#include <algorithm>
#include <cstring>
#include <fstream>
#include <vector>

namespace mediacat::extraction {

using json = nlohmann::json;

namespace {

constexpr std::byte kPngSignature[] = {std::byte{0x89}, std::byte{'P'},  std::byte{'N'},
                                       std::byte{'G'},  std::byte{0x0D}, std::byte{0x0A},
                                       std::byte{0x1A}, std::byte{0x0A}};

uint32_t be16(std::span<const std::byte> d, size_t at) {
    return (static_cast<uint32_t>(d[at]) << 8) | static_cast<uint32_t>(d[at + 1]);
}

uint32_t be32(std::span<const std::byte> d, size_t at) {
    return (be16(d, at) << 16) | be16(d, at + 2);
}

uint32_t le16(std::span<const std::byte> d, size_t at) {
    return static_cast<uint32_t>(d[at]) | (static_cast<uint32_t>(d[at + 1]) << 8);
}

uint32_t le24(std::span<const std::byte> d, size_t at) {
    return le16(d, at) | (static_cast<uint32_t>(d[at + 2]) << 16);
}

uint32_t le32(std::span<const std::byte> d, size_t at) {
    return le16(d, at) | (le16(d, at + 2) << 16);
}

bool startsWith(std::span<const std::byte> d, size_t at, const char* tag) {
    const size_t len = std::strlen(tag);
    return d.size() >= at + len && std::memcmp(d.data() + at, tag, len) == 0;
}

std::string asString(std::span<const std::byte> d) {
    return std::string(reinterpret_cast<const char*>(d.data()), d.size());
}

// Text chunks are nominally Latin-1 but tools routinely write UTF-8
std::string decodeText(const std::string& raw) {
    std::string sanitized = common::sanitizeUtf8(raw);
    if (sanitized == raw)
        return raw;
    return common::latin1ToUtf8(raw);
}

void parsePngText(std::span<const std::byte> chunk, bool international, json& fields) {
    const std::string body = asString(chunk);
    const auto nul = body.find('\0');
    if (nul == std::string::npos || nul == 0)
        return;
    const std::string keyword = decodeText(body.substr(0, nul));

    if (!international) {
        fields[keyword] = decodeText(body.substr(nul + 1));
        return;
    }

    // iTXt: keyword\0 flag method language\0 translated\0 text
    if (body.size() < nul + 3)
        return;
    const bool compressed = body[nul + 1] != 0;
    if (compressed) {
        spdlog::debug("Skipping compressed iTXt chunk '{}'", keyword);
        return;
    }
    const auto langEnd = body.find('\0', nul + 3);
    if (langEnd == std::string::npos)
        return;
    const auto translatedEnd = body.find('\0', langEnd + 1);
    if (translatedEnd == std::string::npos)
        return;
    fields[keyword] = common::sanitizeUtf8(body.substr(translatedEnd + 1));
}

bool isSofMarker(uint8_t marker) {
    return marker >= 0xC0 && marker <= 0xCF && marker != 0xC4 && marker != 0xC8 &&
           marker != 0xCC;
}

Result<std::vector<std::byte>> readPrefix(const std::filesystem::path& path, size_t maxBytes) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file)
        return Error{ErrorCode::FileNotFound, "Cannot open file: " + path.string()};

    const auto size = file.tellg();
    if (size <= 0)
        return Error{ErrorCode::InvalidData, "File is empty: " + path.string()};

    const size_t toRead = std::min(static_cast<size_t>(size), maxBytes);
    std::vector<std::byte> data(toRead);
    file.seekg(0);
    file.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(toRead));
    if (!file)
        return Error{ErrorCode::IOError, "Failed to read file: " + path.string()};
    return data;
}

} // namespace

bool ExtractedMetadata::empty() const {
    if (width || height)
        return false;
    for (auto it = fields.begin(); it != fields.end(); ++it) {
        if (it.key() != "mime_type")
            return false;
    }
    return true;
}

std::string ExtractedMetadata::toJson() const {
    return fields.dump(-1, ' ', false, json::error_handler_t::replace);
}

MetadataExtractor::MetadataExtractor(MetadataExtractorConfig config) : config_(std::move(config)) {}

ExtractedMetadata MetadataExtractor::extract(const std::filesystem::path& path,
                                             const detection::MediaType& type) const {
    ExtractedMetadata result;
    result.fields["mime_type"] = type.mimeType;

    if (type.isVideo) {
        auto dims = probeDimensions(path);
        if (dims) {
            result.width = dims.value().first;
            result.height = dims.value().second;
        } else {
            spdlog::warn("Video probe failed for {}: {}", path.string(), dims.error().message);
        }
        return result;
    }

    auto data = readPrefix(path, config_.maxParseBytes);
    if (!data) {
        spdlog::warn("Metadata extraction failed for {}: {}", path.string(),
                     data.error().message);
        return result;
    }

    auto header = parseImage(data.value(), type.mimeType);
    if (header) {
        for (auto it = header->fields.begin(); it != header->fields.end(); ++it) {
            result.fields[it.key()] = it.value();
        }
        result.width = header->width;
        result.height = header->height;
    }

    if (!result.width || !result.height) {
        auto dims = probeDimensions(path);
        if (dims) {
            result.width = dims.value().first;
            result.height = dims.value().second;
        } else {
            spdlog::warn("Could not determine dimensions for {} ({}): {}", path.string(),
                         type.mimeType, dims.error().message);
            result.width.reset();
            result.height.reset();
        }
    }
    return result;
}

std::optional<ImageHeader> MetadataExtractor::parseImage(std::span<const std::byte> data,
                                                         const std::string& mimeType) {
    if (mimeType == "image/png")
        return parsePng(data);
    if (mimeType == "image/jpeg")
        return parseJpeg(data);
    if (mimeType == "image/gif")
        return parseGif(data);
    if (mimeType == "image/webp")
        return parseWebp(data);
    if (mimeType == "image/tiff")
        return parseTiff(data);
    return std::nullopt;
}

std::optional<ImageHeader> MetadataExtractor::parsePng(std::span<const std::byte> data) {
    if (data.size() < 33 || std::memcmp(data.data(), kPngSignature, sizeof(kPngSignature)) != 0)
        return std::nullopt;

    ImageHeader header;
    size_t pos = sizeof(kPngSignature);
    while (pos + 12 <= data.size()) {
        const uint32_t length = be32(data, pos);
        const size_t bodyStart = pos + 8;
        if (length > data.size() - bodyStart)
            break;
        auto body = data.subspan(bodyStart, length);

        if (startsWith(data, pos + 4, "IHDR") && length >= 8) {
            header.width = static_cast<int>(be32(body, 0));
            header.height = static_cast<int>(be32(body, 4));
        } else if (startsWith(data, pos + 4, "tEXt")) {
            parsePngText(body, false, header.fields);
        } else if (startsWith(data, pos + 4, "iTXt")) {
            parsePngText(body, true, header.fields);
        } else if (startsWith(data, pos + 4, "IEND")) {
            break;
        }
        pos = bodyStart + length + 4; // skip CRC
    }

    if (!header.width)
        return std::nullopt;
    return header;
}

std::optional<ImageHeader> MetadataExtractor::parseJpeg(std::span<const std::byte> data) {
    if (data.size() < 4 || data[0] != std::byte{0xFF} || data[1] != std::byte{0xD8})
        return std::nullopt;

    ImageHeader header;
    size_t pos = 2;
    while (pos + 4 <= data.size()) {
        if (data[pos] != std::byte{0xFF})
            break;
        // fill bytes
        while (pos + 1 < data.size() && data[pos + 1] == std::byte{0xFF})
            ++pos;
        if (pos + 4 > data.size())
            break;

        const auto marker = static_cast<uint8_t>(data[pos + 1]);
        if (marker == 0x01 || (marker >= 0xD0 && marker <= 0xD8)) {
            pos += 2;
            continue;
        }
        if (marker == 0xD9 || marker == 0xDA)
            break;

        const uint32_t length = be16(data, pos + 2);
        if (length < 2 || pos + 2 + length > data.size())
            break;
        auto segment = data.subspan(pos + 4, length - 2);

        if (isSofMarker(marker) && segment.size() >= 5) {
            header.height = static_cast<int>(be16(segment, 1));
            header.width = static_cast<int>(be16(segment, 3));
        } else if (marker == 0xE0 && startsWith(segment, 0, "JFIF") && segment.size() >= 12) {
            const auto major = static_cast<int>(segment[5]);
            const auto minor = static_cast<int>(segment[6]);
            header.fields["jfif"] = std::to_string(major) + "." + (minor < 10 ? "0" : "") +
                                    std::to_string(minor);
            const auto units = static_cast<int>(segment[7]);
            const double xDensity = be16(segment, 8);
            const double yDensity = be16(segment, 10);
            if (units == 1) {
                header.fields["dpi"] = json::array({xDensity, yDensity});
            } else if (units == 2) {
                header.fields["dpi"] = json::array({xDensity * 2.54, yDensity * 2.54});
            }
        } else if (marker == 0xE1 && startsWith(segment, 0, "Exif")) {
            header.fields["exif"] = common::sanitizeUtf8(asString(segment));
        } else if (marker == 0xFE) {
            header.fields["comment"] = decodeText(asString(segment));
        }
        pos += 2 + length;
    }

    if (!header.width || *header.width == 0)
        return std::nullopt;
    return header;
}

std::optional<ImageHeader> MetadataExtractor::parseGif(std::span<const std::byte> data) {
    if (data.size() < 10 || !(startsWith(data, 0, "GIF87a") || startsWith(data, 0, "GIF89a")))
        return std::nullopt;

    ImageHeader header;
    header.fields["version"] = asString(data.subspan(0, 6));
    header.width = static_cast<int>(le16(data, 6));
    header.height = static_cast<int>(le16(data, 8));
    return header;
}

std::optional<ImageHeader> MetadataExtractor::parseWebp(std::span<const std::byte> data) {
    if (data.size() < 30 || !startsWith(data, 0, "RIFF") || !startsWith(data, 8, "WEBP"))
        return std::nullopt;

    ImageHeader header;
    if (startsWith(data, 12, "VP8 ")) {
        // key frame start code 9d 01 2a precedes the 14-bit dimensions
        if (data[23] != std::byte{0x9D} || data[24] != std::byte{0x01} ||
            data[25] != std::byte{0x2A})
            return std::nullopt;
        header.width = static_cast<int>(le16(data, 26) & 0x3FFF);
        header.height = static_cast<int>(le16(data, 28) & 0x3FFF);
    } else if (startsWith(data, 12, "VP8L")) {
        if (data[20] != std::byte{0x2F})
            return std::nullopt;
        const uint32_t bits = le32(data, 21);
        header.width = static_cast<int>((bits & 0x3FFF) + 1);
        header.height = static_cast<int>(((bits >> 14) & 0x3FFF) + 1);
    } else if (startsWith(data, 12, "VP8X")) {
        header.width = static_cast<int>(le24(data, 24) + 1);
        header.height = static_cast<int>(le24(data, 27) + 1);
    } else {
        return std::nullopt;
    }
    return header;
}

std::optional<ImageHeader> MetadataExtractor::parseTiff(std::span<const std::byte> data) {
    if (data.size() < 8)
        return std::nullopt;

    bool littleEndian = false;
    if (startsWith(data, 0, "II") && data[2] == std::byte{42} && data[3] == std::byte{0}) {
        littleEndian = true;
    } else if (!(startsWith(data, 0, "MM") && data[2] == std::byte{0} &&
                 data[3] == std::byte{42})) {
        return std::nullopt;
    }

    auto u16 = [&](size_t at) { return littleEndian ? le16(data, at) : be16(data, at); };
    auto u32 = [&](size_t at) { return littleEndian ? le32(data, at) : be32(data, at); };

    const size_t ifd = u32(4);
    if (ifd + 2 > data.size())
        return std::nullopt;
    const uint32_t entries = u16(ifd);

    ImageHeader header;
    for (uint32_t i = 0; i < entries; ++i) {
        const size_t entry = ifd + 2 + i * 12;
        if (entry + 12 > data.size())
            break;
        const uint32_t tag = u16(entry);
        const uint32_t type = u16(entry + 2);
        if (tag != 256 && tag != 257)
            continue;
        // SHORT (3) is left-justified in the 4-byte value field
        const uint32_t value = type == 3 ? u16(entry + 8) : u32(entry + 8);
        if (tag == 256) {
            header.width = static_cast<int>(value);
        } else {
            header.height = static_cast<int>(value);
        }
    }

    if (!header.width || !header.height)
        return std::nullopt;
    return header;
}

Result<std::pair<int, int>> MetadataExtractor::probeDimensions(
    const std::filesystem::path& path) const {
    auto output = runProcess({config_.ffprobePath, "-v", "error", "-select_streams", "v:0",
                              "-show_entries", "stream=width,height", "-of", "json",
                              path.string()});
    if (!output)
        return output.error();

    json info = json::parse(output.value().stdoutText, nullptr, false);
    if (info.is_discarded())
        return Error{ErrorCode::InvalidData, "Unparsable ffprobe output"};

    auto streams = info.find("streams");
    if (streams == info.end() || !streams->is_array() || streams->empty())
        return Error{ErrorCode::NotFound, "No video stream"};

    const auto& stream = streams->front();
    if (!stream.contains("width") || !stream.contains("height") ||
        !stream["width"].is_number_integer() || !stream["height"].is_number_integer())
        return Error{ErrorCode::InvalidData, "Stream has no dimensions"};

    return std::make_pair(stream["width"].get<int>(), stream["height"].get<int>());
}

} // namespace mediacat::extraction
