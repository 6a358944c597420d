#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <span>
#include <string>
#include <mediacat/core/types.h>

namespace mediacat::crypto {

// Files are streamed through the hasher in blocks of this size
inline constexpr size_t DEFAULT_BUFFER_SIZE = 64 * 1024;

// Interface for content hashers
class IContentHasher {
public:
    virtual ~IContentHasher() = default;

    // Stream-based hashing
    virtual void init() = 0;
    virtual void update(std::span<const std::byte> data) = 0;
    virtual std::string finalize() = 0;

    /**
     * @brief Hash a whole file
     *
     * Returns ErrorCode::Unavailable when the file cannot be opened or read completely;
     * callers treat that as "skip and retry later".
     */
    virtual Result<std::string> hashFile(const std::filesystem::path& path) = 0;
};

// SHA-256 implementation (lowercase hex digests)
class SHA256Hasher : public IContentHasher {
public:
    SHA256Hasher();
    ~SHA256Hasher() override;

    SHA256Hasher(const SHA256Hasher&) = delete;
    SHA256Hasher& operator=(const SHA256Hasher&) = delete;
    SHA256Hasher(SHA256Hasher&&) noexcept;
    SHA256Hasher& operator=(SHA256Hasher&&) noexcept;

    void init() override;
    void update(std::span<const std::byte> data) override;
    std::string finalize() override;

    Result<std::string> hashFile(const std::filesystem::path& path) override;

    // Static utility for one-shot hashing
    static std::string hash(std::span<const std::byte> data);

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

// Factory function
std::unique_ptr<IContentHasher> createSHA256Hasher();

} // namespace mediacat::crypto
