/**
 * @file local_transport.h
 * @brief In-process transport bound directly to an upload_server
 */

#ifndef KCENON_CHUNKED_UPLOAD_CLIENT_LOCAL_TRANSPORT_H
#define KCENON_CHUNKED_UPLOAD_CLIENT_LOCAL_TRANSPORT_H

#include "kcenon/chunked_upload/client/upload_transport.h"
#include "kcenon/chunked_upload/server/upload_server.h"

namespace kcenon::chunked_upload {

/**
 * @brief Calls the server's operations in the calling thread
 *
 * The server must outlive the transport.
 */
class local_transport : public upload_transport {
public:
    explicit local_transport(upload_server& server) : server_(server) {}

    [[nodiscard]] auto init_session(const init_request& request)
        -> result<init_response> override;

    [[nodiscard]] auto resume_session(const std::string& session_id)
        -> result<init_response> override;

    [[nodiscard]] auto put_chunk(const std::string& session_id,
                                 uint32_t index,
                                 std::span<const std::byte> data,
                                 uint32_t crc32) -> result<put_chunk_response> override;

    [[nodiscard]] auto finalize(const std::string& session_id,
                                uint32_t total_chunks,
                                const std::string& object_name)
        -> result<finalize_response> override;

private:
    upload_server& server_;
};

}  // namespace kcenon::chunked_upload

#endif  // KCENON_CHUNKED_UPLOAD_CLIENT_LOCAL_TRANSPORT_H
