#include <gtest/gtest.h>
#include <mediacat/detection/media_type_detector.h>

#include "test_helpers.h"

using namespace mediacat;
using namespace mediacat::detection;

class MediaTypeDetectorTest : public test::MediacatTest {
protected:
    MediaTypeDetector detector;
};

TEST_F(MediaTypeDetectorTest, ExtensionTable) {
    struct Case {
        const char* file;
        const char* mime;
        bool supported;
        bool video;
    };
    for (const auto& c : {Case{"a.JPG", "image/jpeg", true, false},
                          Case{"a.jpeg", "image/jpeg", true, false},
                          Case{"a.png", "image/png", true, false},
                          Case{"a.webp", "image/webp", true, false},
                          Case{"a.heic", "image/heic", true, false},
                          Case{"a.tiff", "image/tiff", true, false},
                          Case{"clip.mp4", "video/mp4", true, true},
                          Case{"clip.MOV", "video/quicktime", true, true},
                          Case{"clip.webm", "video/webm", true, true},
                          Case{"notes.txt", "application/octet-stream", false, false},
                          Case{"noext", "application/octet-stream", false, false}}) {
        auto type = MediaTypeDetector::fromExtension(c.file);
        EXPECT_EQ(type.mimeType, c.mime) << c.file;
        EXPECT_EQ(type.supported, c.supported) << c.file;
        EXPECT_EQ(type.isVideo, c.video) << c.file;
    }
}

TEST_F(MediaTypeDetectorTest, SupportedSetAndVideoPrefix) {
    EXPECT_TRUE(MediaTypeDetector::isSupportedMimeType("image/gif"));
    EXPECT_TRUE(MediaTypeDetector::isSupportedMimeType("video/x-msvideo"));
    EXPECT_FALSE(MediaTypeDetector::isSupportedMimeType("image/bmp"));
    EXPECT_FALSE(MediaTypeDetector::isSupportedMimeType("application/pdf"));

    EXPECT_TRUE(MediaTypeDetector::isVideoMimeType("video/webm"));
    EXPECT_FALSE(MediaTypeDetector::isVideoMimeType("image/webp"));
}

TEST_F(MediaTypeDetectorTest, SniffsJpegRegardlessOfName) {
    if (!detector.hasLibMagic())
        GTEST_SKIP() << "libmagic database unavailable";

    auto path = test::writeTestJpeg(testDir / "photo.bin", 32, 16);
    auto type = detector.detect(path);
    ASSERT_TRUE(type) << type.error().message;
    EXPECT_EQ(type.value().mimeType, "image/jpeg");
    EXPECT_TRUE(type.value().supported);
    EXPECT_FALSE(type.value().isVideo);
}

TEST_F(MediaTypeDetectorTest, DetectsPng) {
    auto path = writeFile("image.png", test::makePng(8, 8));
    auto type = detector.detect(path);
    ASSERT_TRUE(type);
    EXPECT_EQ(type.value().mimeType, "image/png");
    EXPECT_TRUE(type.value().supported);
}

TEST_F(MediaTypeDetectorTest, TextFileIsUnsupported) {
    auto path = writeFile("readme.txt", "just some text\n");
    auto type = detector.detect(path);
    ASSERT_TRUE(type);
    EXPECT_FALSE(type.value().supported);
}

TEST_F(MediaTypeDetectorTest, EmptyFileFallsBackToExtension) {
    auto path = writeFile("empty.gif", "");
    auto type = detector.detect(path);
    ASSERT_TRUE(type);
    EXPECT_EQ(type.value().mimeType, "image/gif");
}

TEST_F(MediaTypeDetectorTest, MissingFile) {
    auto type = detector.detect(testDir / "missing.jpg");
    ASSERT_FALSE(type);
    EXPECT_EQ(type.error().code, ErrorCode::FileNotFound);
}
