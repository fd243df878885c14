/**
 * @file local_transport.cpp
 * @brief In-process transport implementation
 */

#include "kcenon/chunked_upload/client/local_transport.h"

namespace kcenon::chunked_upload {

auto local_transport::init_session(const init_request& request) -> result<init_response> {
    return server_.init_session(request);
}

auto local_transport::resume_session(const std::string& session_id) -> result<init_response> {
    return server_.resume_session(session_id);
}

auto local_transport::put_chunk(const std::string& session_id,
                                uint32_t index,
                                std::span<const std::byte> data,
                                uint32_t crc32) -> result<put_chunk_response> {
    return server_.put_chunk(session_id, index, data, crc32);
}

auto local_transport::finalize(const std::string& session_id,
                               uint32_t total_chunks,
                               const std::string& object_name) -> result<finalize_response> {
    return server_.finalize(session_id, total_chunks, object_name);
}

}  // namespace kcenon::chunked_upload
