/**
 * @file upload_client.h
 * @brief Client entry point for chunked uploads
 */

#ifndef KCENON_CHUNKED_UPLOAD_CLIENT_UPLOAD_CLIENT_H
#define KCENON_CHUNKED_UPLOAD_CLIENT_UPLOAD_CLIENT_H

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "kcenon/chunked_upload/client/chunk_source.h"
#include "kcenon/chunked_upload/client/client_types.h"
#include "kcenon/chunked_upload/client/transfer_scheduler.h"
#include "kcenon/chunked_upload/client/upload_transport.h"
#include "kcenon/chunked_upload/core/types.h"

namespace kcenon::chunked_upload {

/**
 * @brief Uploads objects through an upload_transport
 *
 * Each upload opens a session, plans the transfer and hands it to its own
 * transfer_scheduler, so objects never share pause, cancel or retry state.
 *
 * @code
 * auto client = upload_client::builder()
 *     .with_transport(std::make_shared<local_transport>(server))
 *     .build();
 * if (!client) {
 *     return;
 * }
 *
 * auto source = file_chunk_source::open("video.mp4");
 * auto done = client.value().upload(source.value(), "video.mp4");
 * @endcode
 */
class upload_client {
public:
    class builder {
    public:
        builder();

        /**
         * @brief Transport to the server (required)
         * @return Reference to builder for chaining
         */
        auto with_transport(std::shared_ptr<upload_transport> transport) -> builder&;

        /**
         * @return Reference to builder for chaining
         */
        auto with_retry_config(retry_config config) -> builder&;

        /**
         * @brief Force a chunk size over planner and server recommendation
         * @return Reference to builder for chaining
         */
        auto with_chunk_size_override(uint32_t size) -> builder&;

        /**
         * @brief MIME type sent when an upload does not name one
         * @return Reference to builder for chaining
         */
        auto with_default_mime_type(std::string mime_type) -> builder&;

        /**
         * @return Reference to builder for chaining
         */
        auto with_progress_callback(
            std::function<void(const std::string&, const transfer_progress&)> callback)
            -> builder&;

        /**
         * @return The client, or invalid_argument without a transport
         */
        [[nodiscard]] auto build() -> result<upload_client>;

    private:
        std::shared_ptr<upload_transport> transport_;
        client_config config_;
    };

    upload_client(const upload_client&) = delete;
    auto operator=(const upload_client&) -> upload_client& = delete;
    upload_client(upload_client&&) noexcept;
    auto operator=(upload_client&&) noexcept -> upload_client&;
    ~upload_client();

    /**
     * @brief Open a session and start sending @p source
     *
     * @param mime_type Empty for the configured default
     * @return The running scheduler; pause, resume, cancel and wait on it
     */
    [[nodiscard]] auto start_upload(std::shared_ptr<chunk_source> source,
                                    const std::string& object_name,
                                    const std::string& mime_type = {})
        -> result<std::shared_ptr<transfer_scheduler>>;

    /**
     * @brief Continue an open session, sending only the chunks it lacks
     */
    [[nodiscard]] auto resume_upload(const std::string& session_id,
                                     std::shared_ptr<chunk_source> source,
                                     const std::string& object_name)
        -> result<std::shared_ptr<transfer_scheduler>>;

    /**
     * @brief Upload @p source and block until it is assembled or fails
     */
    [[nodiscard]] auto upload(std::shared_ptr<chunk_source> source,
                              const std::string& object_name,
                              const std::string& mime_type = {}) -> result<upload_result>;

    /**
     * @brief Upload a local file
     * @param object_name Defaults to the file name of @p path
     */
    [[nodiscard]] auto upload_file(const std::filesystem::path& path,
                                   const std::string& object_name = {})
        -> result<upload_result>;

    /**
     * @brief Upload several objects concurrently
     *
     * One object failing does not affect the others.
     * @return One result per item, in the order of @p items
     */
    [[nodiscard]] auto upload_batch(const std::vector<batch_upload_item>& items,
                                    const batch_options& options = {})
        -> std::vector<result<upload_result>>;

    [[nodiscard]] auto config() const -> const client_config&;

private:
    upload_client(std::shared_ptr<upload_transport> transport, client_config config);

    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::chunked_upload

#endif  // KCENON_CHUNKED_UPLOAD_CLIENT_UPLOAD_CLIENT_H
