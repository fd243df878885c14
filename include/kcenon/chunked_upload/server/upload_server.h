/**
 * @file upload_server.h
 * @brief Server side of the chunked upload protocol
 */

#ifndef KCENON_CHUNKED_UPLOAD_SERVER_UPLOAD_SERVER_H
#define KCENON_CHUNKED_UPLOAD_SERVER_UPLOAD_SERVER_H

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "kcenon/chunked_upload/core/protocol_types.h"
#include "kcenon/chunked_upload/core/types.h"
#include "kcenon/chunked_upload/server/server_types.h"

namespace kcenon::chunked_upload {

/**
 * @brief Accepts chunked uploads and assembles them into an upload directory
 *
 * Combines the session registry, the chunk receiver and the assembler over
 * filesystem stores. All operations are thread-safe.
 *
 * @code
 * auto server = upload_server::builder()
 *     .with_upload_directory("/data/uploads")
 *     .with_recommended_chunk_size(10 * MiB)
 *     .build();
 * if (!server) {
 *     return;
 * }
 *
 * auto session = server.value().init_session({"video.mp4", size, "video/mp4"});
 * @endcode
 */
class upload_server {
public:
    class builder {
    public:
        builder();

        auto with_upload_directory(const std::filesystem::path& dir) -> builder&;

        auto with_temp_directory(const std::filesystem::path& dir) -> builder&;

        /**
         * @brief Chunk size suggested to clients, 0 to let clients decide
         */
        auto with_recommended_chunk_size(uint32_t size) -> builder&;

        /**
         * @brief Reject objects declared larger than @p max_bytes, 0 for no limit
         */
        auto with_max_object_size(uint64_t max_bytes) -> builder&;

        /**
         * @brief Validate the configuration and create the directories
         */
        [[nodiscard]] auto build() -> result<upload_server>;

    private:
        server_config config_;
    };

    upload_server(const upload_server&) = delete;
    auto operator=(const upload_server&) -> upload_server& = delete;
    upload_server(upload_server&&) noexcept;
    auto operator=(upload_server&&) noexcept -> upload_server&;
    ~upload_server();

    /**
     * @brief Open a session for a new object
     */
    [[nodiscard]] auto init_session(const init_request& request) -> result<init_response>;

    /**
     * @brief Describe an open session so a client can continue it
     *
     * already_received_indices lists the parts present in the temp area.
     */
    [[nodiscard]] auto resume_session(std::string_view session_id) -> result<init_response>;

    [[nodiscard]] auto put_chunk(std::string_view session_id,
                                 uint32_t index,
                                 std::span<const std::byte> data,
                                 std::optional<uint32_t> crc32 = std::nullopt)
        -> result<put_chunk_response>;

    [[nodiscard]] auto finalize(std::string_view session_id,
                                uint32_t total_chunks,
                                const std::string& object_name) -> result<finalize_response>;

    /**
     * @brief Remove sessions that were opened more than @p max_age ago
     * @return Number of sessions removed
     */
    auto purge_expired(std::chrono::seconds max_age) -> std::size_t;

    [[nodiscard]] auto get_statistics() const -> server_statistics;

    [[nodiscard]] auto config() const -> const server_config&;

private:
    explicit upload_server(server_config config);

    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::chunked_upload

#endif  // KCENON_CHUNKED_UPLOAD_SERVER_UPLOAD_SERVER_H
