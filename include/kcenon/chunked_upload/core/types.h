/**
 * @file types.h
 * @brief Core type definitions for chunked_upload
 */

#ifndef KCENON_CHUNKED_UPLOAD_CORE_TYPES_H
#define KCENON_CHUNKED_UPLOAD_CORE_TYPES_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace kcenon::chunked_upload {

/**
 * @brief Error codes for chunked upload operations
 */
enum class error_code {
    success = 0,

    // Argument and state errors (-100 to -119)
    invalid_argument = -100,
    invalid_state = -101,
    transfer_in_progress = -102,
    transfer_cancelled = -103,

    // Transmission errors (-120 to -139)
    transmission_error = -120,
    chunk_upload_exhausted = -121,

    // Session and assembly errors (-140 to -159)
    session_not_found = -140,
    missing_chunk = -141,
    invalid_chunk_index = -142,
    chunk_checksum_error = -143,
    size_mismatch = -144,
    object_too_large = -145,

    // Storage errors (-160 to -179)
    file_not_found = -160,
    file_read_error = -161,
    file_write_error = -162,

    internal_error = -200,
};

/**
 * @brief Convert error code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) -> const char* {
    switch (code) {
        case error_code::success:
            return "success";
        case error_code::invalid_argument:
            return "invalid argument";
        case error_code::invalid_state:
            return "invalid state";
        case error_code::transfer_in_progress:
            return "transfer in progress";
        case error_code::transfer_cancelled:
            return "transfer cancelled";
        case error_code::transmission_error:
            return "transmission error";
        case error_code::chunk_upload_exhausted:
            return "chunk upload exhausted";
        case error_code::session_not_found:
            return "session not found";
        case error_code::missing_chunk:
            return "missing chunk";
        case error_code::invalid_chunk_index:
            return "invalid chunk index";
        case error_code::chunk_checksum_error:
            return "chunk checksum error";
        case error_code::size_mismatch:
            return "size mismatch";
        case error_code::object_too_large:
            return "object too large";
        case error_code::file_not_found:
            return "file not found";
        case error_code::file_read_error:
            return "file read error";
        case error_code::file_write_error:
            return "file write error";
        case error_code::internal_error:
            return "internal error";
        default:
            return "unknown error";
    }
}

/**
 * @brief Whether a failed chunk send with this code may be attempted again
 *
 * Session and argument errors are final: resending the same bytes to the
 * same session cannot succeed.
 */
[[nodiscard]] constexpr auto is_retryable(error_code code) -> bool {
    switch (code) {
        case error_code::transmission_error:
        case error_code::chunk_checksum_error:
        case error_code::file_write_error:
        case error_code::internal_error:
            return true;
        default:
            return false;
    }
}

/**
 * @brief Error type with code, message and the chunk it concerns, if any
 */
struct error {
    error_code code;
    std::string message;
    std::optional<uint32_t> chunk_index;

    error() : code(error_code::success) {}
    explicit error(error_code c) : code(c), message(to_string(c)) {}
    error(error_code c, std::string msg) : code(c), message(std::move(msg)) {}
    error(error_code c, std::string msg, uint32_t index)
        : code(c), message(std::move(msg)), chunk_index(index) {}

    [[nodiscard]] explicit operator bool() const noexcept {
        return code != error_code::success;
    }
};

/**
 * @brief Wrapper for unexpected error (used with result<T>)
 */
struct unexpected {
    error err;

    explicit unexpected(error e) : err(std::move(e)) {}
};

/**
 * @brief Result type for operations that can fail
 *
 * Holds either a value of type T or an error, in the manner of
 * std::expected.
 */
template <typename T>
class result {
public:
    result() : value_(std::nullopt), error_{} {}

    result(T value) : value_(std::move(value)), error_{} {}

    result(unexpected u) : value_(std::nullopt), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return value_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return value_.has_value(); }

    [[nodiscard]] auto value() & -> T& { return *value_; }
    [[nodiscard]] auto value() const& -> const T& { return *value_; }
    [[nodiscard]] auto value() && -> T&& { return std::move(*value_); }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    std::optional<T> value_;
    struct error error_;
};

/**
 * @brief Specialization of result for void return type
 */
template <>
class result<void> {
public:
    result() : has_value_(true) {}

    result(unexpected u) : has_value_(false), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    bool has_value_;
    struct error error_;
};

/// Raw chunk payload
using byte_buffer = std::vector<std::byte>;

/// Size constants
inline constexpr uint64_t KiB = 1024ULL;
inline constexpr uint64_t MiB = 1024ULL * KiB;
inline constexpr uint64_t GiB = 1024ULL * MiB;

}  // namespace kcenon::chunked_upload

#endif  // KCENON_CHUNKED_UPLOAD_CORE_TYPES_H
