/**
 * @file chunk_source.cpp
 * @brief Implementation of upload byte sources
 */

#include "kcenon/chunked_upload/client/chunk_source.h"

#include <algorithm>
#include <string>

namespace kcenon::chunked_upload {

namespace {

auto check_range(uint64_t offset, uint64_t length, uint64_t size) -> result<void> {
    if (offset > size || length > size - offset) {
        return unexpected(error(error_code::invalid_argument,
                                "range [" + std::to_string(offset) + ", +" +
                                    std::to_string(length) + ") exceeds object size " +
                                    std::to_string(size)));
    }
    return {};
}

}  // namespace

auto file_chunk_source::open(const std::filesystem::path& path)
    -> result<std::shared_ptr<file_chunk_source>> {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return unexpected(error(error_code::file_not_found,
                                "file not found: " + path.string()));
    }

    auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        return unexpected(error(error_code::file_read_error,
                                "cannot get file size: " + ec.message()));
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return unexpected(error(error_code::file_read_error,
                                "cannot open file: " + path.string()));
    }

    return std::shared_ptr<file_chunk_source>(
        new file_chunk_source(path, static_cast<uint64_t>(size), std::move(file)));
}

file_chunk_source::file_chunk_source(std::filesystem::path path,
                                     uint64_t size,
                                     std::ifstream file)
    : path_(std::move(path)), size_(size), file_(std::move(file)) {}

auto file_chunk_source::read(uint64_t offset, uint64_t length) -> result<byte_buffer> {
    if (auto valid = check_range(offset, length, size_); !valid) {
        return unexpected(valid.error());
    }

    byte_buffer data(static_cast<std::size_t>(length));

    std::lock_guard lock(mutex_);
    file_.clear();
    file_.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
    if (!file_) {
        return unexpected(error(error_code::file_read_error,
                                "seek failed at offset " + std::to_string(offset)));
    }

    file_.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(length));
    if (static_cast<uint64_t>(file_.gcount()) != length) {
        return unexpected(error(error_code::file_read_error,
                                "short read at offset " + std::to_string(offset)));
    }
    return data;
}

auto memory_chunk_source::read(uint64_t offset, uint64_t length) -> result<byte_buffer> {
    if (auto valid = check_range(offset, length, data_.size()); !valid) {
        return unexpected(valid.error());
    }
    auto first = data_.begin() + static_cast<std::ptrdiff_t>(offset);
    return byte_buffer(first, first + static_cast<std::ptrdiff_t>(length));
}

}  // namespace kcenon::chunked_upload
