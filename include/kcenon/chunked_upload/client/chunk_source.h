/**
 * @file chunk_source.h
 * @brief Random-access readers over the object being uploaded
 */

#ifndef KCENON_CHUNKED_UPLOAD_CLIENT_CHUNK_SOURCE_H
#define KCENON_CHUNKED_UPLOAD_CLIENT_CHUNK_SOURCE_H

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>

#include "kcenon/chunked_upload/core/types.h"

namespace kcenon::chunked_upload {

/**
 * @brief Byte source for an upload; read() may be called from several threads
 */
class chunk_source {
public:
    virtual ~chunk_source() = default;

    [[nodiscard]] virtual auto size() const -> uint64_t = 0;

    /**
     * @brief Read @p length bytes at @p offset
     *
     * A range reaching past the end fails with invalid_argument.
     */
    [[nodiscard]] virtual auto read(uint64_t offset, uint64_t length) -> result<byte_buffer> = 0;
};

/**
 * @brief chunk_source over a local file
 */
class file_chunk_source : public chunk_source {
public:
    /**
     * @brief Open @p path for reading
     * @return The source, or file_not_found / file_read_error
     */
    [[nodiscard]] static auto open(const std::filesystem::path& path)
        -> result<std::shared_ptr<file_chunk_source>>;

    [[nodiscard]] auto size() const -> uint64_t override { return size_; }

    [[nodiscard]] auto read(uint64_t offset, uint64_t length) -> result<byte_buffer> override;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return path_; }

private:
    file_chunk_source(std::filesystem::path path, uint64_t size, std::ifstream file);

    std::filesystem::path path_;
    uint64_t size_;
    std::ifstream file_;
    std::mutex mutex_;
};

/**
 * @brief chunk_source over a buffer held in memory
 */
class memory_chunk_source : public chunk_source {
public:
    explicit memory_chunk_source(byte_buffer data) : data_(std::move(data)) {}

    [[nodiscard]] auto size() const -> uint64_t override { return data_.size(); }

    [[nodiscard]] auto read(uint64_t offset, uint64_t length) -> result<byte_buffer> override;

private:
    byte_buffer data_;
};

}  // namespace kcenon::chunked_upload

#endif  // KCENON_CHUNKED_UPLOAD_CLIENT_CHUNK_SOURCE_H
