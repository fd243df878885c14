/**
 * @file checksum.h
 * @brief Chunk and object integrity checks
 */

#ifndef KCENON_CHUNKED_UPLOAD_CORE_CHECKSUM_H
#define KCENON_CHUNKED_UPLOAD_CORE_CHECKSUM_H

#include <kcenon/chunked_upload/core/types.h>

#include <cstddef>
#include <memory>
#include <span>
#include <string>

namespace kcenon::chunked_upload {

/**
 * @brief Checksum helpers
 *
 * CRC32 guards each chunk between client and receiver. SHA-256 digests the
 * assembled object.
 */
class checksum {
public:
    /**
     * @brief Calculate CRC32 (IEEE 802.3) of a buffer
     */
    [[nodiscard]] static auto crc32(std::span<const std::byte> data) -> uint32_t;

    [[nodiscard]] static auto verify_crc32(
        std::span<const std::byte> data, uint32_t expected) -> bool;

    /**
     * @brief SHA-256 of a buffer as lowercase hex
     */
    [[nodiscard]] static auto sha256(std::span<const std::byte> data) -> result<std::string>;
};

/**
 * @brief Incremental SHA-256 over OpenSSL EVP
 *
 * Used by the assembler to digest the object while it streams parts into
 * the output, so the object is never read twice.
 */
class sha256_hasher {
public:
    sha256_hasher();
    ~sha256_hasher();

    sha256_hasher(const sha256_hasher&) = delete;
    auto operator=(const sha256_hasher&) -> sha256_hasher& = delete;

    [[nodiscard]] auto update(std::span<const std::byte> data) -> result<void>;

    /**
     * @brief Finish the digest
     * @return Lowercase hex digest; the hasher cannot be updated afterwards
     */
    [[nodiscard]] auto finish() -> result<std::string>;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::chunked_upload

#endif  // KCENON_CHUNKED_UPLOAD_CORE_CHECKSUM_H
