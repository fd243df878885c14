/**
 * @file protocol_types.h
 * @brief Request and response payloads exchanged between client and server
 *
 * These are the values carried by the three upload operations, init,
 * put chunk and finalize, independent of how they travel.
 */

#ifndef KCENON_CHUNKED_UPLOAD_CORE_PROTOCOL_TYPES_H
#define KCENON_CHUNKED_UPLOAD_CORE_PROTOCOL_TYPES_H

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace kcenon::chunked_upload {

/**
 * @brief Parameters of an init request
 */
struct init_request {
    std::string object_name;
    uint64_t declared_size = 0;
    std::string mime_type;
};

/**
 * @brief Answer to an init request
 */
struct init_response {
    std::string session_id;

    /// Chunk size the server prefers; 0 leaves the client plan unchanged
    uint32_t recommended_chunk_size = 0;

    /// Indices the server already holds for this session
    std::vector<uint32_t> already_received_indices;
};

struct put_chunk_response {
    bool ok = false;
    std::string stored_location;
};

struct finalize_response {
    bool ok = false;
    std::filesystem::path final_path;
    std::string original_name;
    std::string sanitized_name;
    uint64_t size = 0;

    /// SHA-256 of the assembled object, lowercase hex
    std::string sha256;
};

}  // namespace kcenon::chunked_upload

#endif  // KCENON_CHUNKED_UPLOAD_CORE_PROTOCOL_TYPES_H
