/**
 * @file chunked_upload.h
 * @brief Main header for chunked_upload library
 * @version 0.1.0
 *
 * Include this header to access the client and server sides of the
 * chunked upload protocol.
 *
 * @code
 * #include <kcenon/chunked_upload/chunked_upload.h>
 *
 * using namespace kcenon::chunked_upload;
 *
 * auto server = upload_server::builder()
 *     .with_upload_directory("/path/to/uploads")
 *     .build();
 *
 * auto client = upload_client::builder()
 *     .with_transport(std::make_shared<local_transport>(server.value()))
 *     .build();
 * @endcode
 */

#ifndef KCENON_CHUNKED_UPLOAD_CHUNKED_UPLOAD_H
#define KCENON_CHUNKED_UPLOAD_CHUNKED_UPLOAD_H

#include <string>

// Core types
#include "kcenon/chunked_upload/core/types.h"
#include "kcenon/chunked_upload/core/protocol_types.h"
#include "kcenon/chunked_upload/core/transfer_plan.h"
#include "kcenon/chunked_upload/core/checksum.h"

// Server
#include "kcenon/chunked_upload/server/server_types.h"
#include "kcenon/chunked_upload/server/upload_server.h"

// Client
#include "kcenon/chunked_upload/client/client_types.h"
#include "kcenon/chunked_upload/client/chunk_source.h"
#include "kcenon/chunked_upload/client/local_transport.h"
#include "kcenon/chunked_upload/client/transfer_scheduler.h"
#include "kcenon/chunked_upload/client/upload_client.h"

namespace kcenon::chunked_upload {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;

    static std::string to_string() {
        return std::to_string(major) + "." +
               std::to_string(minor) + "." +
               std::to_string(patch);
    }
};

}  // namespace kcenon::chunked_upload

#endif  // KCENON_CHUNKED_UPLOAD_CHUNKED_UPLOAD_H
