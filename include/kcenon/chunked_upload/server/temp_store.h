/**
 * @file temp_store.h
 * @brief Keyed blob storage for chunks awaiting assembly
 */

#ifndef KCENON_CHUNKED_UPLOAD_SERVER_TEMP_STORE_H
#define KCENON_CHUNKED_UPLOAD_SERVER_TEMP_STORE_H

#include <kcenon/chunked_upload/core/types.h>

#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace kcenon::chunked_upload {

/**
 * @brief Key of chunk @p index of session @p session_id, "<session>/part_<index>"
 */
[[nodiscard]] auto chunk_key(std::string_view session_id, uint32_t index) -> std::string;

/**
 * @brief Storage for chunk records
 *
 * Keys are "<area>/<name>". An area groups the records of one session and
 * is removed as a whole once the session ends.
 */
class temp_store {
public:
    virtual ~temp_store() = default;

    /**
     * @brief Create the area for a session
     * @return Location of the area
     */
    [[nodiscard]] virtual auto create_area(std::string_view area)
        -> result<std::filesystem::path> = 0;

    /**
     * @brief Store @p data under @p key, replacing any previous record atomically
     * @return Location of the stored record
     */
    [[nodiscard]] virtual auto write(std::string_view key, std::span<const std::byte> data)
        -> result<std::string> = 0;

    [[nodiscard]] virtual auto read(std::string_view key) -> result<byte_buffer> = 0;

    [[nodiscard]] virtual auto exists(std::string_view key) const -> bool = 0;

    [[nodiscard]] virtual auto size_of(std::string_view key) const -> result<uint64_t> = 0;

    [[nodiscard]] virtual auto remove(std::string_view key) -> result<void> = 0;

    /**
     * @brief Names of the records in an area, without the area prefix
     */
    [[nodiscard]] virtual auto list_area(std::string_view area) const
        -> result<std::vector<std::string>> = 0;

    /**
     * @brief Remove an area and every record in it
     */
    [[nodiscard]] virtual auto remove_area(std::string_view area) -> result<void> = 0;
};

/**
 * @brief temp_store on a local directory, one subdirectory per area
 */
class filesystem_temp_store : public temp_store {
public:
    explicit filesystem_temp_store(std::filesystem::path root);

    [[nodiscard]] auto create_area(std::string_view area)
        -> result<std::filesystem::path> override;
    [[nodiscard]] auto write(std::string_view key, std::span<const std::byte> data)
        -> result<std::string> override;
    [[nodiscard]] auto read(std::string_view key) -> result<byte_buffer> override;
    [[nodiscard]] auto exists(std::string_view key) const -> bool override;
    [[nodiscard]] auto size_of(std::string_view key) const -> result<uint64_t> override;
    [[nodiscard]] auto remove(std::string_view key) -> result<void> override;
    [[nodiscard]] auto list_area(std::string_view area) const
        -> result<std::vector<std::string>> override;
    [[nodiscard]] auto remove_area(std::string_view area) -> result<void> override;

    [[nodiscard]] auto root() const -> const std::filesystem::path& { return root_; }

private:
    [[nodiscard]] auto path_of(std::string_view key) const -> std::filesystem::path;

    std::filesystem::path root_;
};

}  // namespace kcenon::chunked_upload

#endif  // KCENON_CHUNKED_UPLOAD_SERVER_TEMP_STORE_H
