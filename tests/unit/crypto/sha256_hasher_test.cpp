#include <gtest/gtest.h>
#include <mediacat/crypto/hasher.h>

#include "test_helpers.h"

using namespace mediacat;
using namespace mediacat::crypto;
using namespace mediacat::test;

class SHA256HasherTest : public MediacatTest {
protected:
    std::unique_ptr<SHA256Hasher> hasher;

    void SetUp() override {
        MediacatTest::SetUp();
        hasher = std::make_unique<SHA256Hasher>();
    }
};

TEST_F(SHA256HasherTest, EmptyInput) {
    hasher->init();
    auto hash = hasher->finalize();
    EXPECT_EQ(hash, TestVectors::EMPTY_SHA256);
}

TEST_F(SHA256HasherTest, KnownTestVectors) {
    {
        auto data = TestVectors::getABCData();
        hasher->init();
        hasher->update(std::span<const std::byte>{data});
        EXPECT_EQ(hasher->finalize(), TestVectors::ABC_SHA256);
    }

    {
        auto data = TestVectors::getHelloWorldData();
        hasher->init();
        hasher->update(std::span<const std::byte>{data});
        EXPECT_EQ(hasher->finalize(), TestVectors::HELLO_WORLD_SHA256);
    }
}

TEST_F(SHA256HasherTest, StreamingUpdate) {
    auto data = generateRandomBytes(1000);

    hasher->init();
    hasher->update(std::span<const std::byte>{data.data(), 100});
    hasher->update(std::span<const std::byte>{data.data() + 100, 400});
    hasher->update(std::span<const std::byte>{data.data() + 500, 500});
    auto hash1 = hasher->finalize();

    EXPECT_EQ(hash1, SHA256Hasher::hash(data));
}

TEST_F(SHA256HasherTest, FileHashingMatchesInMemoryAcrossBlockBoundaries) {
    // Spans several read blocks with a ragged tail
    auto content = generateRandomBytes(3 * DEFAULT_BUFFER_SIZE + 123);
    auto path = writeBytes("large.bin", content);

    auto fileHash = hasher->hashFile(path);
    ASSERT_TRUE(fileHash) << fileHash.error().message;
    EXPECT_EQ(fileHash.value(), SHA256Hasher::hash(content));
    EXPECT_EQ(fileHash.value().size(), 64u);
}

TEST_F(SHA256HasherTest, DigestIsLowercaseHex) {
    auto hash = SHA256Hasher::hash(generateRandomBytes(64));
    for (char c : hash) {
        EXPECT_TRUE((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f')) << hash;
    }
}

TEST_F(SHA256HasherTest, MissingFile) {
    auto result = hasher->hashFile(testDir / "missing.bin");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::Unavailable);
}

TEST_F(SHA256HasherTest, FactoryProducesSha256) {
    auto generic = createSHA256Hasher();
    auto path = writeFile("hello.txt", "Hello World");
    auto result = generic->hashFile(path);
    ASSERT_TRUE(result);
    EXPECT_EQ(result.value(), TestVectors::HELLO_WORLD_SHA256);
}
