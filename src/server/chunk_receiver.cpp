/**
 * @file chunk_receiver.cpp
 * @brief Implementation of chunk persistence
 */

#include <kcenon/chunked_upload/server/chunk_receiver.h>

#include <kcenon/chunked_upload/core/checksum.h>
#include <kcenon/chunked_upload/core/logging.h>

#include <mutex>
#include <shared_mutex>

namespace kcenon::chunked_upload {

chunk_receiver::chunk_receiver(std::shared_ptr<session_registry> registry,
                               std::shared_ptr<temp_store> store)
    : registry_(std::move(registry)), store_(std::move(store)) {}

auto chunk_receiver::put(std::string_view session_id,
                         uint32_t index,
                         std::span<const std::byte> data,
                         std::optional<uint32_t> expected_crc32)
    -> result<put_chunk_response> {
    auto entry = registry_->find(session_id);
    if (!entry) {
        return unexpected(error(error_code::session_not_found,
                                "upload session not found", index));
    }

    std::shared_lock lock(entry->lock);
    if (entry->closed) {
        return unexpected(error(error_code::session_not_found,
                                "upload session not found", index));
    }

    if (expected_crc32 && !checksum::verify_crc32(data, *expected_crc32)) {
        upload_log_context ctx;
        ctx.session_id = entry->info.session_id;
        ctx.chunk_index = index;
        CU_LOG_WARN_CTX(log_category::receiver, "Chunk checksum mismatch", ctx);
        return unexpected(error(error_code::chunk_checksum_error,
                                "CRC32 mismatch for chunk " + std::to_string(index), index));
    }

    auto stored = store_->write(chunk_key(entry->info.session_id, index), data);
    if (!stored) {
        auto err = stored.error();
        err.chunk_index = index;
        return unexpected(std::move(err));
    }

    upload_log_context ctx;
    ctx.session_id = entry->info.session_id;
    ctx.chunk_index = index;
    ctx.bytes_sent = data.size();
    ctx.path = stored.value();
    CU_LOG_DEBUG_CTX(log_category::receiver, "Chunk stored", ctx);

    put_chunk_response response;
    response.ok = true;
    response.stored_location = std::move(stored.value());
    return response;
}

}  // namespace kcenon::chunked_upload
