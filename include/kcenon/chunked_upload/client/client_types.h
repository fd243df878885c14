/**
 * @file client_types.h
 * @brief Client-related type definitions for chunked_upload
 */

#ifndef KCENON_CHUNKED_UPLOAD_CLIENT_CLIENT_TYPES_H
#define KCENON_CHUNKED_UPLOAD_CLIENT_CLIENT_TYPES_H

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "kcenon/chunked_upload/core/protocol_types.h"
#include "kcenon/chunked_upload/core/types.h"

namespace kcenon::chunked_upload {

class chunk_source;

/**
 * @brief Lifecycle of one object upload
 */
enum class transfer_status {
    pending,     ///< Not started, or cancelled
    uploading,   ///< Chunks are being sent
    paused,      ///< Paused and no send is in flight
    assembling,  ///< All chunks acknowledged, finalize requested
    done,        ///< Object assembled on the server
    error        ///< Failed; see last_error
};

[[nodiscard]] constexpr auto to_string(transfer_status status) noexcept -> const char* {
    switch (status) {
        case transfer_status::pending: return "pending";
        case transfer_status::uploading: return "uploading";
        case transfer_status::paused: return "paused";
        case transfer_status::assembling: return "assembling";
        case transfer_status::done: return "done";
        case transfer_status::error: return "error";
        default: return "unknown";
    }
}

[[nodiscard]] constexpr auto is_terminal(transfer_status status) noexcept -> bool {
    return status == transfer_status::done || status == transfer_status::error;
}

/**
 * @brief Snapshot of an upload's progress
 */
struct transfer_progress {
    uint64_t total_bytes = 0;
    uint64_t sent_bytes = 0;

    /// 0..99 while running, 100 once done
    uint32_t percent = 0;

    /// Bytes per second since start, when measurable
    std::optional<double> speed_bps;
    std::optional<double> eta_seconds;

    transfer_status status = transfer_status::pending;
    std::optional<error> last_error;

    uint32_t acknowledged_chunks = 0;
    uint32_t total_chunks = 0;
};

/**
 * @brief Backoff between attempts to send one chunk
 *
 * The n-th retry of a chunk waits n * base_delay, plus
 * large_object_extra_delay when the object has more than
 * large_object_chunk_threshold chunks.
 */
struct retry_config {
    std::chrono::milliseconds base_delay{1000};
    std::chrono::milliseconds large_object_extra_delay{2000};
    uint32_t large_object_chunk_threshold = 100;
};

/**
 * @brief Client configuration
 */
struct client_config {
    retry_config retry;

    /// Forces a chunk size over both planner and server recommendation
    std::optional<uint32_t> chunk_size_override;

    std::string default_mime_type = "application/octet-stream";

    /// Called with the object name for every progress change of every upload
    std::function<void(const std::string&, const transfer_progress&)> progress_callback;
};

/**
 * @brief One object of a batch upload
 */
struct batch_upload_item {
    std::shared_ptr<chunk_source> source;
    std::string object_name;
    std::string mime_type;
};

/**
 * @brief Options for upload_batch()
 */
struct batch_options {
    /// Objects uploading at the same time
    std::size_t max_concurrent = 4;
};

/**
 * @brief Outcome of a completed upload
 */
struct upload_result {
    std::string object_name;
    std::string session_id;
    finalize_response response;
    transfer_progress progress;
};

}  // namespace kcenon::chunked_upload

#endif  // KCENON_CHUNKED_UPLOAD_CLIENT_CLIENT_TYPES_H
