/**
 * @file transfer_plan.cpp
 * @brief Implementation of chunk planning
 */

#include "kcenon/chunked_upload/core/transfer_plan.h"

#include <algorithm>
#include <array>
#include <string>

namespace kcenon::chunked_upload {

namespace {

struct plan_tier {
    uint64_t max_object_size;
    uint32_t chunk_size;
    uint8_t concurrency;
    uint8_t max_retries;
};

constexpr std::array<plan_tier, 4> PLAN_TIERS = {{
    {50 * MiB, static_cast<uint32_t>(5 * MiB), 6, 3},
    {500 * MiB, static_cast<uint32_t>(10 * MiB), 4, 3},
    {2 * GiB, static_cast<uint32_t>(25 * MiB), 3, 4},
    {10 * GiB, static_cast<uint32_t>(50 * MiB), 2, 5},
}};

constexpr plan_tier HUGE_OBJECT_TIER = {0, static_cast<uint32_t>(100 * MiB), 1, 5};

}  // namespace

auto transfer_plan::range_of(uint64_t index) const -> chunk_range {
    if (index >= chunk_count()) {
        return {};
    }
    uint64_t offset = index * chunk_size;
    return {offset, std::min<uint64_t>(chunk_size, object_size - offset)};
}

auto transfer_plan::with_chunk_size(uint32_t size) const -> transfer_plan {
    transfer_plan copy = *this;
    if (size > 0) {
        copy.chunk_size = size;
    }
    return copy;
}

auto transfer_plan::validate() const -> result<void> {
    if (chunk_size == 0) {
        return unexpected(error(error_code::invalid_argument, "chunk size must be positive"));
    }
    if (concurrency < 1 || concurrency > max_concurrency) {
        return unexpected(error(
            error_code::invalid_argument,
            "concurrency must be between 1 and " + std::to_string(max_concurrency)));
    }
    if (chunk_count() > UINT32_MAX) {
        return unexpected(error(error_code::invalid_argument,
                                "chunk size too small for object size"));
    }
    return {};
}

auto plan_transfer(uint64_t object_size) -> transfer_plan {
    const plan_tier* tier = &HUGE_OBJECT_TIER;
    for (const auto& candidate : PLAN_TIERS) {
        if (object_size <= candidate.max_object_size) {
            tier = &candidate;
            break;
        }
    }

    transfer_plan plan;
    plan.object_size = object_size;
    plan.chunk_size = tier->chunk_size;
    plan.concurrency = tier->concurrency;
    plan.max_retries = tier->max_retries;
    return plan;
}

}  // namespace kcenon::chunked_upload
