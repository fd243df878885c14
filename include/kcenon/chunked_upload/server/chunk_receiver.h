/**
 * @file chunk_receiver.h
 * @brief Persists chunks as they arrive
 */

#ifndef KCENON_CHUNKED_UPLOAD_SERVER_CHUNK_RECEIVER_H
#define KCENON_CHUNKED_UPLOAD_SERVER_CHUNK_RECEIVER_H

#include <kcenon/chunked_upload/core/protocol_types.h>
#include <kcenon/chunked_upload/core/types.h>
#include <kcenon/chunked_upload/server/session_registry.h>
#include <kcenon/chunked_upload/server/temp_store.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string_view>

namespace kcenon::chunked_upload {

/**
 * @brief Stores one chunk of an open session
 *
 * Chunks may arrive in any order and more than once; a repeated index
 * replaces the earlier record. Completeness is checked at assembly, not
 * here.
 */
class chunk_receiver {
public:
    chunk_receiver(std::shared_ptr<session_registry> registry,
                   std::shared_ptr<temp_store> store);

    /**
     * @brief Persist chunk @p index of @p session_id
     *
     * @param expected_crc32 When present, the bytes must match it
     * @return Where the chunk was stored, or session_not_found,
     *         chunk_checksum_error, file_write_error
     */
    [[nodiscard]] auto put(std::string_view session_id,
                           uint32_t index,
                           std::span<const std::byte> data,
                           std::optional<uint32_t> expected_crc32 = std::nullopt)
        -> result<put_chunk_response>;

private:
    std::shared_ptr<session_registry> registry_;
    std::shared_ptr<temp_store> store_;
};

}  // namespace kcenon::chunked_upload

#endif  // KCENON_CHUNKED_UPLOAD_SERVER_CHUNK_RECEIVER_H
