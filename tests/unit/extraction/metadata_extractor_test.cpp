#include <gtest/gtest.h>
#include <mediacat/core/process.h>
#include <mediacat/extraction/metadata_extractor.h>

#include "test_helpers.h"

using namespace mediacat;
using namespace mediacat::extraction;
using detection::MediaType;

namespace {

std::vector<std::byte> bytesOf(const std::string& s) {
    return std::vector<std::byte>(reinterpret_cast<const std::byte*>(s.data()),
                                  reinterpret_cast<const std::byte*>(s.data() + s.size()));
}

void putBe16(std::string& out, uint16_t v) {
    out.push_back(static_cast<char>(v >> 8));
    out.push_back(static_cast<char>(v & 0xFF));
}

void putLe16(std::string& out, uint16_t v) {
    out.push_back(static_cast<char>(v & 0xFF));
    out.push_back(static_cast<char>(v >> 8));
}

void putLe32(std::string& out, uint32_t v) {
    for (int i = 0; i < 4; ++i)
        out.push_back(static_cast<char>((v >> (8 * i)) & 0xFF));
}

void jpegSegment(std::string& out, uint8_t marker, const std::string& body) {
    out.push_back(static_cast<char>(0xFF));
    out.push_back(static_cast<char>(marker));
    putBe16(out, static_cast<uint16_t>(body.size() + 2));
    out += body;
}

// SOI, JFIF 1.02 at 300 dpi, a comment, optional APP1, SOF0 (height x width), EOI
std::string makeJpegHeader(uint16_t width, uint16_t height, const std::string& comment,
                           const std::string& exif = "") {
    std::string out("\xFF\xD8", 2);

    std::string jfif("JFIF\0", 5);
    jfif.push_back(1);
    jfif.push_back(2);
    jfif.push_back(1); // dots per inch
    putBe16(jfif, 300);
    putBe16(jfif, 300);
    jfif.push_back(0);
    jfif.push_back(0);
    jpegSegment(out, 0xE0, jfif);

    if (!exif.empty())
        jpegSegment(out, 0xE1, std::string("Exif\0\0", 6) + exif);
    jpegSegment(out, 0xFE, comment);

    std::string sof;
    sof.push_back(8);
    putBe16(sof, height);
    putBe16(sof, width);
    sof += std::string("\x03\x01\x22\x00\x02\x11\x01\x03\x11\x01", 10);
    jpegSegment(out, 0xC0, sof);

    out += std::string("\xFF\xD9", 2);
    return out;
}

std::string makeTiff(bool littleEndian, uint32_t width, uint32_t height) {
    std::string out;
    auto u16 = [&](uint16_t v) {
        if (littleEndian)
            putLe16(out, v);
        else
            putBe16(out, v);
    };
    auto u32 = [&](uint32_t v) {
        if (littleEndian) {
            putLe32(out, v);
        } else {
            putBe16(out, static_cast<uint16_t>(v >> 16));
            putBe16(out, static_cast<uint16_t>(v & 0xFFFF));
        }
    };

    out += littleEndian ? "II" : "MM";
    u16(42);
    u32(8);
    u16(2);
    // ImageWidth as SHORT, ImageLength as LONG
    u16(256);
    u16(3);
    u32(1);
    u16(static_cast<uint16_t>(width));
    u16(0);
    u16(257);
    u16(4);
    u32(1);
    u32(height);
    u32(0);
    return out;
}

MetadataExtractor offlineExtractor() {
    MetadataExtractorConfig config;
    config.ffprobePath = "/nonexistent/ffprobe";
    return MetadataExtractor(config);
}

} // namespace

class MetadataExtractorTest : public test::MediacatTest {};

TEST_F(MetadataExtractorTest, PngDimensionsAndTextChunks) {
    auto png = test::makePng(1024, 768,
                             {{"parameters", R"({"sui_image_params":{"prompt":"fox"}})"},
                              {"Software", "caf\xE9"}});
    auto header = MetadataExtractor::parsePng(bytesOf(png));
    ASSERT_TRUE(header.has_value());
    EXPECT_EQ(header->width, 1024);
    EXPECT_EQ(header->height, 768);
    EXPECT_EQ(header->fields["parameters"], R"({"sui_image_params":{"prompt":"fox"}})");
    // tEXt is Latin-1
    EXPECT_EQ(header->fields["Software"], "caf\xC3\xA9");
}

TEST_F(MetadataExtractorTest, TruncatedPngIsRejected) {
    auto png = test::makePng(10, 10);
    auto header = MetadataExtractor::parsePng(bytesOf(png.substr(0, 20)));
    EXPECT_FALSE(header.has_value());
}

TEST_F(MetadataExtractorTest, JpegHeaderFields) {
    auto jpeg = makeJpegHeader(640, 480, "holiday snap");
    auto header = MetadataExtractor::parseJpeg(bytesOf(jpeg));
    ASSERT_TRUE(header.has_value());
    EXPECT_EQ(header->width, 640);
    EXPECT_EQ(header->height, 480);
    EXPECT_EQ(header->fields["jfif"], "1.02");
    EXPECT_EQ(header->fields["comment"], "holiday snap");
    ASSERT_TRUE(header->fields["dpi"].is_array());
    EXPECT_DOUBLE_EQ(header->fields["dpi"][0].get<double>(), 300.0);
}

TEST_F(MetadataExtractorTest, ExifPayloadIsSanitized) {
    auto jpeg = makeJpegHeader(10, 10, "c", std::string("MM\0*\xFF\xFE", 6));
    auto header = MetadataExtractor::parseJpeg(bytesOf(jpeg));
    ASSERT_TRUE(header.has_value());
    ASSERT_TRUE(header->fields.contains("exif"));

    ExtractedMetadata metadata;
    metadata.fields = header->fields;
    // Must not throw on dump
    auto text = metadata.toJson();
    EXPECT_NE(text.find("exif"), std::string::npos);
    EXPECT_NE(header->fields["exif"].get<std::string>().find("\xEF\xBF\xBD"), std::string::npos);
}

TEST_F(MetadataExtractorTest, GifHeader) {
    std::string gif = "GIF89a";
    putLe16(gif, 320);
    putLe16(gif, 200);
    gif += std::string(8, '\0');

    auto header = MetadataExtractor::parseGif(bytesOf(gif));
    ASSERT_TRUE(header.has_value());
    EXPECT_EQ(header->width, 320);
    EXPECT_EQ(header->height, 200);
    EXPECT_EQ(header->fields["version"], "GIF89a");
}

TEST_F(MetadataExtractorTest, WebpVariants) {
    auto riff = [](const std::string& chunk, const std::string& body) {
        std::string out = "RIFF";
        putLe32(out, static_cast<uint32_t>(4 + 8 + body.size()));
        out += "WEBP" + chunk;
        putLe32(out, static_cast<uint32_t>(body.size()));
        out += body;
        return out;
    };

    {
        std::string body(3, '\0');
        body += "\x9D\x01\x2A";
        putLe16(body, 800);
        putLe16(body, 600);
        body += std::string(4, '\0');
        auto header = MetadataExtractor::parseWebp(bytesOf(riff("VP8 ", body)));
        ASSERT_TRUE(header.has_value());
        EXPECT_EQ(header->width, 800);
        EXPECT_EQ(header->height, 600);
    }
    {
        std::string body("\x2F", 1);
        const uint32_t bits = (100 - 1) | ((50 - 1) << 14);
        putLe32(body, bits);
        body += std::string(8, '\0');
        auto header = MetadataExtractor::parseWebp(bytesOf(riff("VP8L", body)));
        ASSERT_TRUE(header.has_value());
        EXPECT_EQ(header->width, 100);
        EXPECT_EQ(header->height, 50);
    }
    {
        std::string body(4, '\0');
        const uint32_t w = 4000 - 1;
        const uint32_t h = 3000 - 1;
        body.push_back(static_cast<char>(w & 0xFF));
        body.push_back(static_cast<char>((w >> 8) & 0xFF));
        body.push_back(static_cast<char>((w >> 16) & 0xFF));
        body.push_back(static_cast<char>(h & 0xFF));
        body.push_back(static_cast<char>((h >> 8) & 0xFF));
        body.push_back(static_cast<char>((h >> 16) & 0xFF));
        body += std::string(4, '\0');
        auto header = MetadataExtractor::parseWebp(bytesOf(riff("VP8X", body)));
        ASSERT_TRUE(header.has_value());
        EXPECT_EQ(header->width, 4000);
        EXPECT_EQ(header->height, 3000);
    }
}

TEST_F(MetadataExtractorTest, TiffBothByteOrders) {
    for (bool le : {true, false}) {
        auto header = MetadataExtractor::parseTiff(bytesOf(makeTiff(le, 1200, 900)));
        ASSERT_TRUE(header.has_value()) << (le ? "II" : "MM");
        EXPECT_EQ(header->width, 1200);
        EXPECT_EQ(header->height, 900);
    }
}

TEST_F(MetadataExtractorTest, ExtractFromRealJpeg) {
    auto path = test::writeTestJpeg(testDir / "real.jpg", 64, 48);
    auto extractor = offlineExtractor();

    auto metadata = extractor.extract(path, MediaType{"image/jpeg", true, false});
    EXPECT_EQ(metadata.fields["mime_type"], "image/jpeg");
    EXPECT_EQ(metadata.width, 64);
    EXPECT_EQ(metadata.height, 48);
    EXPECT_FALSE(metadata.empty());
}

TEST_F(MetadataExtractorTest, CorruptImageYieldsOnlyMimeType) {
    auto path = writeFile("broken.png", "\x89PNG garbage that is not a png");
    auto extractor = offlineExtractor();

    auto metadata = extractor.extract(path, MediaType{"image/png", true, false});
    EXPECT_EQ(metadata.fields["mime_type"], "image/png");
    EXPECT_FALSE(metadata.width.has_value());
    EXPECT_FALSE(metadata.height.has_value());
    EXPECT_TRUE(metadata.empty());
}

TEST_F(MetadataExtractorTest, VideoWithoutProbeKeepsMimeType) {
    auto path = writeFile("clip.mp4", "not really a video");
    auto extractor = offlineExtractor();

    auto metadata = extractor.extract(path, MediaType{"video/mp4", true, true});
    EXPECT_EQ(metadata.fields["mime_type"], "video/mp4");
    EXPECT_FALSE(metadata.width.has_value());
}

TEST_F(MetadataExtractorTest, ProbeDimensionsWithFfprobe) {
    if (!toolAvailable("ffprobe"))
        GTEST_SKIP() << "ffprobe not on PATH";

    auto path = test::writeTestJpeg(testDir / "probe.jpg", 40, 30);
    MetadataExtractor extractor;
    auto dims = extractor.probeDimensions(path);
    ASSERT_TRUE(dims) << dims.error().message;
    EXPECT_EQ(dims.value().first, 40);
    EXPECT_EQ(dims.value().second, 30);
}
