/**
 * @file transfer_plan.h
 * @brief Chunk planning for a single object upload
 */

#ifndef KCENON_CHUNKED_UPLOAD_CORE_TRANSFER_PLAN_H
#define KCENON_CHUNKED_UPLOAD_CORE_TRANSFER_PLAN_H

#include <kcenon/chunked_upload/core/types.h>

#include <cstdint>

namespace kcenon::chunked_upload {

/**
 * @brief Byte range of one chunk inside the object
 */
struct chunk_range {
    uint64_t offset = 0;
    uint64_t length = 0;

    [[nodiscard]] auto operator==(const chunk_range&) const -> bool = default;
};

/**
 * @brief How an object is cut and sent
 */
struct transfer_plan {
    /// Upper bound on concurrent sends for one object
    static constexpr uint8_t max_concurrency = 6;

    uint64_t object_size = 0;
    uint32_t chunk_size = 0;
    uint8_t concurrency = 1;
    uint8_t max_retries = 0;

    /**
     * @brief Number of chunks, ceil(object_size / chunk_size)
     */
    [[nodiscard]] auto chunk_count() const -> uint64_t {
        if (object_size == 0 || chunk_size == 0) return 0;
        return (object_size + chunk_size - 1) / chunk_size;
    }

    /**
     * @brief Byte range covered by chunk @p index
     *
     * The last chunk is shorter when the object size is not a multiple of
     * the chunk size. Indices past the end yield an empty range.
     */
    [[nodiscard]] auto range_of(uint64_t index) const -> chunk_range;

    /**
     * @brief Copy of this plan with a different chunk size; 0 keeps the current one
     */
    [[nodiscard]] auto with_chunk_size(uint32_t size) const -> transfer_plan;

    [[nodiscard]] auto validate() const -> result<void>;

    [[nodiscard]] auto operator==(const transfer_plan&) const -> bool = default;
};

/**
 * @brief Choose chunk size, concurrency and retry budget for an object
 *
 * Larger objects get larger chunks with fewer parallel sends and more
 * retries per chunk:
 *
 * | object size | chunk  | concurrency | retries |
 * |-------------|--------|-------------|---------|
 * | <= 50 MiB   | 5 MiB  | 6           | 3       |
 * | <= 500 MiB  | 10 MiB | 4           | 3       |
 * | <= 2 GiB    | 25 MiB | 3           | 4       |
 * | <= 10 GiB   | 50 MiB | 2           | 5       |
 * | larger      | 100 MiB| 1           | 5       |
 *
 * @param object_size Size in bytes; any value is accepted
 */
[[nodiscard]] auto plan_transfer(uint64_t object_size) -> transfer_plan;

}  // namespace kcenon::chunked_upload

#endif  // KCENON_CHUNKED_UPLOAD_CORE_TRANSFER_PLAN_H
