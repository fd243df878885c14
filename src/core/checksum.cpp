/**
 * @file checksum.cpp
 * @brief Implementation of checksum helpers
 */

#include "kcenon/chunked_upload/core/checksum.h"

#include <openssl/evp.h>

#include <array>

namespace kcenon::chunked_upload {

namespace {

// IEEE 802.3, reflected
constexpr uint32_t CRC32_POLYNOMIAL = 0xEDB88320;

constexpr auto make_crc32_table() -> std::array<uint32_t, 256> {
    std::array<uint32_t, 256> table{};
    for (uint32_t n = 0; n < 256; ++n) {
        uint32_t value = n;
        for (int bit = 0; bit < 8; ++bit) {
            value = (value & 1U) ? (value >> 1) ^ CRC32_POLYNOMIAL : value >> 1;
        }
        table[n] = value;
    }
    return table;
}

constexpr auto CRC32_TABLE = make_crc32_table();

auto to_hex(const unsigned char* data, unsigned int length) -> std::string {
    static constexpr char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(static_cast<std::size_t>(length) * 2);
    for (unsigned int i = 0; i < length; ++i) {
        out.push_back(digits[data[i] >> 4]);
        out.push_back(digits[data[i] & 0x0F]);
    }
    return out;
}

}  // namespace

auto checksum::crc32(std::span<const std::byte> data) -> uint32_t {
    uint32_t crc = 0xFFFFFFFF;
    for (std::byte b : data) {
        crc = CRC32_TABLE[(crc ^ static_cast<uint8_t>(b)) & 0xFFU] ^ (crc >> 8);
    }
    return crc ^ 0xFFFFFFFF;
}

auto checksum::verify_crc32(std::span<const std::byte> data, uint32_t expected) -> bool {
    return crc32(data) == expected;
}

auto checksum::sha256(std::span<const std::byte> data) -> result<std::string> {
    sha256_hasher hasher;
    if (auto r = hasher.update(data); !r) {
        return unexpected(r.error());
    }
    return hasher.finish();
}

struct sha256_hasher::impl {
    EVP_MD_CTX* ctx = nullptr;
    bool ready = false;

    ~impl() {
        if (ctx) {
            EVP_MD_CTX_free(ctx);
        }
    }
};

sha256_hasher::sha256_hasher() : impl_(std::make_unique<impl>()) {
    impl_->ctx = EVP_MD_CTX_new();
    if (impl_->ctx && EVP_DigestInit_ex(impl_->ctx, EVP_sha256(), nullptr) == 1) {
        impl_->ready = true;
    }
}

sha256_hasher::~sha256_hasher() = default;

auto sha256_hasher::update(std::span<const std::byte> data) -> result<void> {
    if (!impl_->ready) {
        return unexpected(error(error_code::internal_error, "SHA-256 context unavailable"));
    }
    if (data.empty()) {
        return {};
    }
    if (EVP_DigestUpdate(impl_->ctx, data.data(), data.size()) != 1) {
        return unexpected(error(error_code::internal_error, "SHA-256 update failed"));
    }
    return {};
}

auto sha256_hasher::finish() -> result<std::string> {
    if (!impl_->ready) {
        return unexpected(error(error_code::internal_error, "SHA-256 context unavailable"));
    }
    impl_->ready = false;

    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(impl_->ctx, digest.data(), &length) != 1) {
        return unexpected(error(error_code::internal_error, "SHA-256 finalization failed"));
    }
    return to_hex(digest.data(), length);
}

}  // namespace kcenon::chunked_upload
