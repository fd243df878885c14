/**
 * @file session_id.h
 * @brief Opaque upload session identifiers
 */

#ifndef KCENON_CHUNKED_UPLOAD_CORE_SESSION_ID_H
#define KCENON_CHUNKED_UPLOAD_CORE_SESSION_ID_H

#include <kcenon/chunked_upload/core/types.h>

#include <cstddef>
#include <string>
#include <string_view>

namespace kcenon::chunked_upload {

/// Random bytes behind a session identifier
inline constexpr std::size_t session_id_bytes = 16;

/// Length of the hex text form
inline constexpr std::size_t session_id_length = session_id_bytes * 2;

/**
 * @brief Random bytes from the OpenSSL CSPRNG as lowercase hex
 * @param byte_count Number of random bytes; the text is twice as long
 */
[[nodiscard]] auto random_hex(std::size_t byte_count) -> result<std::string>;

/**
 * @brief New 128-bit session identifier, 32 lowercase hex characters
 */
[[nodiscard]] auto generate_session_id() -> result<std::string>;

/**
 * @brief Whether @p id has the shape of a generated identifier
 *
 * Only identifiers that pass this check are ever used to build storage
 * paths.
 */
[[nodiscard]] auto is_valid_session_id(std::string_view id) noexcept -> bool;

}  // namespace kcenon::chunked_upload

#endif  // KCENON_CHUNKED_UPLOAD_CORE_SESSION_ID_H
