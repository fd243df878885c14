/**
 * @file upload_transport.h
 * @brief Client-side boundary to the upload server
 */

#ifndef KCENON_CHUNKED_UPLOAD_CLIENT_UPLOAD_TRANSPORT_H
#define KCENON_CHUNKED_UPLOAD_CLIENT_UPLOAD_TRANSPORT_H

#include <cstdint>
#include <span>
#include <string>

#include "kcenon/chunked_upload/core/protocol_types.h"
#include "kcenon/chunked_upload/core/types.h"

namespace kcenon::chunked_upload {

/**
 * @brief Carries the three upload operations to a server
 *
 * Delivery may be at-least-once: a put_chunk can reach the server more
 * than once, which the server absorbs by overwriting. Implementations
 * report connectivity failures as transmission_error so that the sender
 * retries them. Must be safe to call from several threads.
 */
class upload_transport {
public:
    virtual ~upload_transport() = default;

    [[nodiscard]] virtual auto init_session(const init_request& request)
        -> result<init_response> = 0;

    /**
     * @brief Re-attach to an open session and learn which chunks it holds
     */
    [[nodiscard]] virtual auto resume_session(const std::string& session_id)
        -> result<init_response> = 0;

    [[nodiscard]] virtual auto put_chunk(const std::string& session_id,
                                         uint32_t index,
                                         std::span<const std::byte> data,
                                         uint32_t crc32) -> result<put_chunk_response> = 0;

    [[nodiscard]] virtual auto finalize(const std::string& session_id,
                                        uint32_t total_chunks,
                                        const std::string& object_name)
        -> result<finalize_response> = 0;
};

}  // namespace kcenon::chunked_upload

#endif  // KCENON_CHUNKED_UPLOAD_CLIENT_UPLOAD_TRANSPORT_H
