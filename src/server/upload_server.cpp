/**
 * @file upload_server.cpp
 * @brief Upload server implementation
 */

#include "kcenon/chunked_upload/server/upload_server.h"
#include "kcenon/chunked_upload/core/logging.h"
#include "kcenon/chunked_upload/server/assembler.h"
#include "kcenon/chunked_upload/server/chunk_receiver.h"
#include "kcenon/chunked_upload/server/output_store.h"
#include "kcenon/chunked_upload/server/session_registry.h"
#include "kcenon/chunked_upload/server/temp_store.h"

#include <algorithm>
#include <charconv>
#include <mutex>
#include <shared_mutex>

namespace kcenon::chunked_upload {

namespace {

constexpr std::string_view part_prefix = "part_";

auto parse_part_index(const std::string& name) -> std::optional<uint32_t> {
    if (name.size() <= part_prefix.size() || name.compare(0, part_prefix.size(), part_prefix) != 0) {
        return std::nullopt;
    }
    uint32_t index = 0;
    const char* first = name.data() + part_prefix.size();
    const char* last = name.data() + name.size();
    auto [ptr, ec] = std::from_chars(first, last, index);
    if (ec != std::errc{} || ptr != last) {
        return std::nullopt;
    }
    return index;
}

}  // namespace

struct upload_server::impl {
    server_config config;

    std::shared_ptr<filesystem_temp_store> temp;
    std::shared_ptr<filesystem_output_store> output;
    std::shared_ptr<session_registry> registry;
    chunk_receiver receiver;
    assembler object_assembler;

    mutable std::mutex stats_mutex;
    server_statistics statistics;

    explicit impl(server_config cfg)
        : config(std::move(cfg)),
          temp(std::make_shared<filesystem_temp_store>(config.resolved_temp_directory())),
          output(std::make_shared<filesystem_output_store>(config.upload_directory)),
          registry(std::make_shared<session_registry>(temp, config.max_object_size)),
          receiver(registry, temp),
          object_assembler(registry, temp, output) {}
};

// Builder implementation
upload_server::builder::builder() = default;

auto upload_server::builder::with_upload_directory(const std::filesystem::path& dir)
    -> builder& {
    config_.upload_directory = dir;
    return *this;
}

auto upload_server::builder::with_temp_directory(const std::filesystem::path& dir)
    -> builder& {
    config_.temp_directory = dir;
    return *this;
}

auto upload_server::builder::with_recommended_chunk_size(uint32_t size) -> builder& {
    config_.recommended_chunk_size = size;
    return *this;
}

auto upload_server::builder::with_max_object_size(uint64_t max_bytes) -> builder& {
    config_.max_object_size = max_bytes;
    return *this;
}

auto upload_server::builder::build() -> result<upload_server> {
    if (auto valid = config_.validate(); !valid) {
        return unexpected(valid.error());
    }

    for (const auto& dir : {config_.upload_directory, config_.resolved_temp_directory()}) {
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            return unexpected(error(error_code::file_write_error,
                                    "cannot create directory " + dir.string() + ": " +
                                        ec.message()));
        }
    }

    get_logger().initialize();
    return upload_server(config_);
}

upload_server::upload_server(server_config config)
    : impl_(std::make_unique<impl>(std::move(config))) {
    upload_log_context ctx;
    ctx.path = impl_->config.upload_directory.string();
    CU_LOG_INFO_CTX(log_category::server, "Upload server ready", ctx);
}

upload_server::upload_server(upload_server&&) noexcept = default;
auto upload_server::operator=(upload_server&&) noexcept -> upload_server& = default;
upload_server::~upload_server() = default;

auto upload_server::init_session(const init_request& request) -> result<init_response> {
    auto session = impl_->registry->create(request.object_name, request.declared_size,
                                           request.mime_type);
    if (!session) {
        upload_log_context ctx;
        ctx.object_name = request.object_name;
        ctx.object_size = request.declared_size;
        ctx.error_message = session.error().message;
        CU_LOG_WARN_CTX(log_category::server, "Session rejected", ctx);
        return unexpected(session.error());
    }

    {
        std::lock_guard lock(impl_->stats_mutex);
        ++impl_->statistics.sessions_created;
    }

    init_response response;
    response.session_id = session.value().session_id;
    response.recommended_chunk_size = impl_->config.recommended_chunk_size;
    return response;
}

auto upload_server::resume_session(std::string_view session_id) -> result<init_response> {
    auto entry = impl_->registry->find(session_id);
    if (!entry) {
        return unexpected(error(error_code::session_not_found, "upload session not found"));
    }

    std::shared_lock lock(entry->lock);
    if (entry->closed) {
        return unexpected(error(error_code::session_not_found, "upload session not found"));
    }

    auto names = impl_->temp->list_area(entry->info.session_id);
    if (!names) {
        return unexpected(names.error());
    }

    init_response response;
    response.session_id = entry->info.session_id;
    response.recommended_chunk_size = impl_->config.recommended_chunk_size;
    for (const auto& name : names.value()) {
        if (auto index = parse_part_index(name)) {
            response.already_received_indices.push_back(*index);
        }
    }
    std::sort(response.already_received_indices.begin(),
              response.already_received_indices.end());

    upload_log_context ctx;
    ctx.session_id = response.session_id;
    ctx.total_chunks = static_cast<uint32_t>(response.already_received_indices.size());
    CU_LOG_INFO_CTX(log_category::server, "Session resumed", ctx);
    return response;
}

auto upload_server::put_chunk(std::string_view session_id,
                              uint32_t index,
                              std::span<const std::byte> data,
                              std::optional<uint32_t> crc32) -> result<put_chunk_response> {
    auto stored = impl_->receiver.put(session_id, index, data, crc32);
    if (stored) {
        std::lock_guard lock(impl_->stats_mutex);
        ++impl_->statistics.chunks_received;
        impl_->statistics.bytes_received += data.size();
    }
    return stored;
}

auto upload_server::finalize(std::string_view session_id,
                             uint32_t total_chunks,
                             const std::string& object_name) -> result<finalize_response> {
    auto assembled = impl_->object_assembler.finalize(session_id, total_chunks, object_name);
    if (assembled) {
        std::lock_guard lock(impl_->stats_mutex);
        ++impl_->statistics.objects_assembled;
    }
    return assembled;
}

auto upload_server::purge_expired(std::chrono::seconds max_age) -> std::size_t {
    auto purged = impl_->registry->purge_expired(max_age);
    std::lock_guard lock(impl_->stats_mutex);
    impl_->statistics.sessions_expired += purged;
    return purged;
}

auto upload_server::get_statistics() const -> server_statistics {
    std::lock_guard lock(impl_->stats_mutex);
    auto stats = impl_->statistics;
    stats.active_sessions = impl_->registry->size();
    return stats;
}

auto upload_server::config() const -> const server_config& {
    return impl_->config;
}

}  // namespace kcenon::chunked_upload
