/**
 * @file session_id.cpp
 * @brief Session identifier generation backed by OpenSSL RAND_bytes
 */

#include "kcenon/chunked_upload/core/session_id.h"

#include <openssl/rand.h>

#include <algorithm>
#include <vector>

namespace kcenon::chunked_upload {

auto random_hex(std::size_t byte_count) -> result<std::string> {
    std::vector<unsigned char> bytes(byte_count);
    if (byte_count > 0 &&
        RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
        return unexpected(error(error_code::internal_error,
                                "random number generator unavailable"));
    }

    static constexpr char digits[] = "0123456789abcdef";
    std::string text;
    text.reserve(byte_count * 2);
    for (unsigned char b : bytes) {
        text.push_back(digits[b >> 4]);
        text.push_back(digits[b & 0x0F]);
    }
    return text;
}

auto generate_session_id() -> result<std::string> {
    return random_hex(session_id_bytes);
}

auto is_valid_session_id(std::string_view id) noexcept -> bool {
    if (id.size() != session_id_length) {
        return false;
    }
    return std::all_of(id.begin(), id.end(), [](char c) {
        return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
    });
}

}  // namespace kcenon::chunked_upload
