/**
 * @file temp_store.cpp
 * @brief Filesystem implementation of the chunk temp store
 */

#include <kcenon/chunked_upload/server/temp_store.h>

#include <kcenon/chunked_upload/core/session_id.h>

#include <fstream>

namespace kcenon::chunked_upload {

auto chunk_key(std::string_view session_id, uint32_t index) -> std::string {
    std::string key(session_id);
    key += "/part_";
    key += std::to_string(index);
    return key;
}

filesystem_temp_store::filesystem_temp_store(std::filesystem::path root)
    : root_(std::move(root)) {
    std::error_code ec;
    std::filesystem::create_directories(root_, ec);
}

auto filesystem_temp_store::path_of(std::string_view key) const -> std::filesystem::path {
    return root_ / std::filesystem::path(key);
}

auto filesystem_temp_store::create_area(std::string_view area)
    -> result<std::filesystem::path> {
    auto dir = path_of(area);
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        return unexpected(error(error_code::file_write_error,
                                "cannot create temp area: " + ec.message()));
    }
    return dir;
}

auto filesystem_temp_store::write(std::string_view key, std::span<const std::byte> data)
    -> result<std::string> {
    auto target = path_of(key);
    if (!std::filesystem::is_directory(target.parent_path())) {
        return unexpected(error(error_code::file_not_found,
                                "temp area missing for " + std::string(key)));
    }

    // A concurrent duplicate put must never expose a half-written record,
    // so each write goes to its own sibling and is renamed into place.
    auto suffix = random_hex(8);
    if (!suffix) {
        return unexpected(suffix.error());
    }
    auto staging = target;
    staging += ".partial_" + suffix.value();

    {
        std::ofstream out(staging, std::ios::binary | std::ios::trunc);
        if (!out) {
            return unexpected(error(error_code::file_write_error,
                                    "cannot open " + staging.string()));
        }
        out.write(reinterpret_cast<const char*>(data.data()),
                  static_cast<std::streamsize>(data.size()));
        out.flush();
        if (!out) {
            std::error_code ec;
            std::filesystem::remove(staging, ec);
            return unexpected(error(error_code::file_write_error,
                                    "short write to " + staging.string()));
        }
    }

    std::error_code ec;
    std::filesystem::rename(staging, target, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(staging, ignored);
        return unexpected(error(error_code::file_write_error,
                                "cannot store chunk: " + ec.message()));
    }
    return target.string();
}

auto filesystem_temp_store::read(std::string_view key) -> result<byte_buffer> {
    auto source = path_of(key);
    std::error_code ec;
    auto size = std::filesystem::file_size(source, ec);
    if (ec) {
        return unexpected(error(error_code::file_not_found,
                                "no record for " + std::string(key)));
    }

    std::ifstream in(source, std::ios::binary);
    if (!in) {
        return unexpected(error(error_code::file_read_error,
                                "cannot open " + source.string()));
    }

    byte_buffer data(static_cast<std::size_t>(size));
    in.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(size));
    if (static_cast<uint64_t>(in.gcount()) != size) {
        return unexpected(error(error_code::file_read_error,
                                "short read from " + source.string()));
    }
    return data;
}

auto filesystem_temp_store::exists(std::string_view key) const -> bool {
    std::error_code ec;
    return std::filesystem::is_regular_file(path_of(key), ec);
}

auto filesystem_temp_store::size_of(std::string_view key) const -> result<uint64_t> {
    std::error_code ec;
    auto size = std::filesystem::file_size(path_of(key), ec);
    if (ec) {
        return unexpected(error(error_code::file_not_found,
                                "no record for " + std::string(key)));
    }
    return static_cast<uint64_t>(size);
}

auto filesystem_temp_store::remove(std::string_view key) -> result<void> {
    std::error_code ec;
    std::filesystem::remove(path_of(key), ec);
    if (ec) {
        return unexpected(error(error_code::file_write_error,
                                "cannot remove record: " + ec.message()));
    }
    return {};
}

auto filesystem_temp_store::list_area(std::string_view area) const
    -> result<std::vector<std::string>> {
    std::error_code ec;
    std::filesystem::directory_iterator it(path_of(area), ec);
    if (ec) {
        return unexpected(error(error_code::file_not_found,
                                "no temp area " + std::string(area)));
    }

    std::vector<std::string> names;
    for (const auto& entry : it) {
        if (entry.is_regular_file(ec)) {
            names.push_back(entry.path().filename().string());
        }
    }
    return names;
}

auto filesystem_temp_store::remove_area(std::string_view area) -> result<void> {
    if (area.empty()) {
        return unexpected(error(error_code::invalid_argument, "empty area name"));
    }
    std::error_code ec;
    std::filesystem::remove_all(path_of(area), ec);
    if (ec) {
        return unexpected(error(error_code::file_write_error,
                                "cannot remove temp area: " + ec.message()));
    }
    return {};
}

}  // namespace kcenon::chunked_upload
