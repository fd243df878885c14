/**
 * @file server_types.h
 * @brief Server-related type definitions for chunked_upload
 */

#ifndef KCENON_CHUNKED_UPLOAD_SERVER_SERVER_TYPES_H
#define KCENON_CHUNKED_UPLOAD_SERVER_SERVER_TYPES_H

#include <kcenon/chunked_upload/core/types.h>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace kcenon::chunked_upload {

/**
 * @brief State the server keeps for one object between init and finalize
 */
struct upload_session {
    std::string session_id;
    std::string object_name;
    uint64_t declared_size = 0;
    std::string mime_type;
    std::filesystem::path temp_area;
    std::chrono::system_clock::time_point created_at;
};

/**
 * @brief Server configuration
 */
struct server_config {
    /// Directory that receives assembled objects
    std::filesystem::path upload_directory;

    /// Directory holding per-session chunk areas; empty selects a
    /// "tmp_uploads" sibling of the upload directory
    std::filesystem::path temp_directory;

    uint32_t recommended_chunk_size = static_cast<uint32_t>(10 * MiB);

    /// Largest accepted declared size, 0 for no limit
    uint64_t max_object_size = 0;

    [[nodiscard]] auto resolved_temp_directory() const -> std::filesystem::path {
        if (!temp_directory.empty()) {
            return temp_directory;
        }
        auto parent = directory_path(upload_directory).parent_path();
        return parent.empty() ? std::filesystem::path("tmp_uploads")
                              : parent / "tmp_uploads";
    }

    [[nodiscard]] auto validate() const -> result<void> {
        if (upload_directory.empty()) {
            return unexpected(error(error_code::invalid_argument,
                                    "upload directory is required"));
        }
        auto upload = directory_path(upload_directory);
        auto temp = directory_path(resolved_temp_directory());
        if (upload == temp) {
            return unexpected(error(error_code::invalid_argument,
                                    "temp directory must differ from upload directory"));
        }
        auto diverge = std::mismatch(upload.begin(), upload.end(), temp.begin(), temp.end());
        if (diverge.first == upload.end()) {
            return unexpected(error(error_code::invalid_argument,
                                    "temp directory must not be inside upload directory"));
        }
        return {};
    }

private:
    /// Normal form without a trailing separator, so "a/b/" and "a/b" compare equal
    static auto directory_path(const std::filesystem::path& dir) -> std::filesystem::path {
        auto normal = dir.lexically_normal();
        if (!normal.has_filename() && normal.has_relative_path()) {
            normal = normal.parent_path();
        }
        return normal;
    }
};

/**
 * @brief Server statistics
 */
struct server_statistics {
    uint64_t sessions_created = 0;
    uint64_t chunks_received = 0;
    uint64_t bytes_received = 0;
    uint64_t objects_assembled = 0;
    uint64_t sessions_expired = 0;
    std::size_t active_sessions = 0;
};

}  // namespace kcenon::chunked_upload

#endif  // KCENON_CHUNKED_UPLOAD_SERVER_SERVER_TYPES_H
