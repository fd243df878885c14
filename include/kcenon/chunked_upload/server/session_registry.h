/**
 * @file session_registry.h
 * @brief Registry of open upload sessions
 */

#ifndef KCENON_CHUNKED_UPLOAD_SERVER_SESSION_REGISTRY_H
#define KCENON_CHUNKED_UPLOAD_SERVER_SESSION_REGISTRY_H

#include <kcenon/chunked_upload/core/types.h>
#include <kcenon/chunked_upload/server/server_types.h>
#include <kcenon/chunked_upload/server/temp_store.h>

#include <chrono>
#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace kcenon::chunked_upload {

/**
 * @brief A registered session with its access lock
 *
 * Chunk writes hold @c lock shared; assembly and expiry hold it exclusively
 * and set @c closed before letting go, after which the entry must not be
 * used.
 */
struct session_entry {
    upload_session info;
    std::shared_mutex lock;
    bool closed = false;
};

/**
 * @brief Issues session identifiers and owns session state
 *
 * Thread-safe.
 */
class session_registry {
public:
    /**
     * @param store Temp store in which each session gets an area
     * @param max_object_size Largest accepted declared size, 0 for no limit
     */
    explicit session_registry(std::shared_ptr<temp_store> store,
                              uint64_t max_object_size = 0);

    session_registry(const session_registry&) = delete;
    auto operator=(const session_registry&) -> session_registry& = delete;

    /**
     * @brief Open a session for an object
     *
     * @param object_name Client-supplied object name, non-empty
     * @param declared_size Size in bytes, non-zero
     * @param mime_type Informational content type
     * @return The new session, or invalid_argument / object_too_large
     */
    [[nodiscard]] auto create(const std::string& object_name,
                              uint64_t declared_size,
                              const std::string& mime_type) -> result<upload_session>;

    /**
     * @brief Look up a session; malformed identifiers never match
     */
    [[nodiscard]] auto find(std::string_view session_id) const
        -> std::shared_ptr<session_entry>;

    /**
     * @brief Drop a session from the registry without touching its temp area
     * @return true if it was registered
     */
    auto remove(std::string_view session_id) -> bool;

    /**
     * @brief Close and delete sessions older than @p max_age, with their temp areas
     * @return Number of sessions removed
     */
    auto purge_expired(std::chrono::seconds max_age) -> std::size_t;

    [[nodiscard]] auto size() const -> std::size_t;

private:
    std::shared_ptr<temp_store> store_;
    uint64_t max_object_size_;

    mutable std::shared_mutex sessions_mutex_;
    std::unordered_map<std::string, std::shared_ptr<session_entry>> sessions_;
};

}  // namespace kcenon::chunked_upload

#endif  // KCENON_CHUNKED_UPLOAD_SERVER_SESSION_REGISTRY_H
