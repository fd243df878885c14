/**
 * @file session_registry.cpp
 * @brief Implementation of the upload session registry
 */

#include <kcenon/chunked_upload/server/session_registry.h>

#include <kcenon/chunked_upload/core/logging.h>
#include <kcenon/chunked_upload/core/session_id.h>

#include <mutex>
#include <vector>

namespace kcenon::chunked_upload {

namespace {

constexpr int max_id_attempts = 8;

}  // namespace

session_registry::session_registry(std::shared_ptr<temp_store> store,
                                   uint64_t max_object_size)
    : store_(std::move(store)), max_object_size_(max_object_size) {}

auto session_registry::create(const std::string& object_name,
                              uint64_t declared_size,
                              const std::string& mime_type) -> result<upload_session> {
    if (object_name.empty()) {
        return unexpected(error(error_code::invalid_argument, "object name is required"));
    }
    if (declared_size == 0) {
        return unexpected(error(error_code::invalid_argument, "object size must be non-zero"));
    }
    if (max_object_size_ > 0 && declared_size > max_object_size_) {
        return unexpected(error(error_code::object_too_large,
                                "object of " + std::to_string(declared_size) +
                                    " bytes exceeds limit of " +
                                    std::to_string(max_object_size_)));
    }

    auto entry = std::make_shared<session_entry>();
    entry->info.object_name = object_name;
    entry->info.declared_size = declared_size;
    entry->info.mime_type = mime_type;
    entry->info.created_at = std::chrono::system_clock::now();

    for (int attempt = 0; attempt < max_id_attempts; ++attempt) {
        auto id = generate_session_id();
        if (!id) {
            return unexpected(id.error());
        }

        std::unique_lock lock(sessions_mutex_);
        if (sessions_.count(id.value()) != 0) {
            continue;
        }

        auto area = store_->create_area(id.value());
        if (!area) {
            return unexpected(area.error());
        }

        entry->info.session_id = id.value();
        entry->info.temp_area = area.value();
        sessions_.emplace(id.value(), entry);
        lock.unlock();

        upload_log_context ctx;
        ctx.session_id = entry->info.session_id;
        ctx.object_name = object_name;
        ctx.object_size = declared_size;
        CU_LOG_INFO_CTX(log_category::registry, "Session created", ctx);
        return entry->info;
    }

    return unexpected(error(error_code::internal_error, "cannot allocate a unique session id"));
}

auto session_registry::find(std::string_view session_id) const
    -> std::shared_ptr<session_entry> {
    if (!is_valid_session_id(session_id)) {
        return nullptr;
    }
    std::shared_lock lock(sessions_mutex_);
    auto it = sessions_.find(std::string(session_id));
    return it == sessions_.end() ? nullptr : it->second;
}

auto session_registry::remove(std::string_view session_id) -> bool {
    std::unique_lock lock(sessions_mutex_);
    return sessions_.erase(std::string(session_id)) > 0;
}

auto session_registry::purge_expired(std::chrono::seconds max_age) -> std::size_t {
    auto cutoff = std::chrono::system_clock::now() - max_age;

    std::vector<std::shared_ptr<session_entry>> expired;
    {
        std::shared_lock lock(sessions_mutex_);
        for (const auto& [id, entry] : sessions_) {
            if (entry->info.created_at < cutoff) {
                expired.push_back(entry);
            }
        }
    }

    std::size_t purged = 0;
    for (auto& entry : expired) {
        // Entry lock before registry lock, the same order finalize uses.
        std::unique_lock entry_lock(entry->lock);
        if (entry->closed) {
            continue;
        }
        entry->closed = true;

        auto removed = store_->remove_area(entry->info.session_id);
        if (!removed) {
            upload_log_context ctx;
            ctx.session_id = entry->info.session_id;
            ctx.error_message = removed.error().message;
            CU_LOG_WARN_CTX(log_category::registry, "Failed to remove expired temp area", ctx);
        }
        remove(entry->info.session_id);
        ++purged;
    }

    if (purged > 0) {
        CU_LOG_INFO(log_category::registry,
                    "Purged " + std::to_string(purged) + " expired session(s)");
    }
    return purged;
}

auto session_registry::size() const -> std::size_t {
    std::shared_lock lock(sessions_mutex_);
    return sessions_.size();
}

}  // namespace kcenon::chunked_upload
