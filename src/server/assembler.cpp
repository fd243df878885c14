/**
 * @file assembler.cpp
 * @brief Implementation of object assembly
 */

#include <kcenon/chunked_upload/server/assembler.h>

#include <kcenon/chunked_upload/core/checksum.h>
#include <kcenon/chunked_upload/core/logging.h>

#include <chrono>
#include <mutex>
#include <string_view>

namespace kcenon::chunked_upload {

namespace {

constexpr std::string_view reserved_characters = "<>:\"/\\|?*[]";

// Assembly of large objects reports progress every this many parts.
constexpr uint32_t progress_log_interval = 50;

}  // namespace

auto sanitize_object_name(std::string_view name) -> std::string {
    std::string out;
    out.reserve(name.size());

    for (std::size_t i = 0; i < name.size(); ++i) {
        char c = name[i];
        if (c == '.' && i + 1 < name.size() && name[i + 1] == '.') {
            while (i + 1 < name.size() && name[i + 1] == '.') {
                ++i;
            }
            out.push_back('_');
            continue;
        }
        if (static_cast<unsigned char>(c) < 0x20 || c == 0x7F ||
            reserved_characters.find(c) != std::string_view::npos) {
            out.push_back('_');
            continue;
        }
        out.push_back(c);
    }

    if (out.empty() || out == ".") {
        return "_";
    }
    return out;
}

assembler::assembler(std::shared_ptr<session_registry> registry,
                     std::shared_ptr<temp_store> temp,
                     std::shared_ptr<output_store> output)
    : registry_(std::move(registry)), temp_(std::move(temp)), output_(std::move(output)) {}

auto assembler::finalize(std::string_view session_id,
                         uint32_t total_chunks,
                         const std::string& object_name) -> result<finalize_response> {
    if (total_chunks == 0) {
        return unexpected(error(error_code::invalid_argument, "total chunk count must be non-zero"));
    }
    if (object_name.empty()) {
        return unexpected(error(error_code::invalid_argument, "object name is required"));
    }

    auto entry = registry_->find(session_id);
    if (!entry) {
        return unexpected(error(error_code::session_not_found, "upload session not found"));
    }

    std::unique_lock lock(entry->lock);
    if (entry->closed) {
        return unexpected(error(error_code::session_not_found, "upload session not found"));
    }

    const auto& session = entry->info;
    upload_log_context ctx;
    ctx.session_id = session.session_id;
    ctx.object_name = object_name;
    ctx.total_chunks = total_chunks;

    for (uint32_t i = 0; i < total_chunks; ++i) {
        if (!temp_->exists(chunk_key(session.session_id, i))) {
            ctx.chunk_index = i;
            CU_LOG_WARN_CTX(log_category::assembler, "Missing chunk, assembly aborted", ctx);
            return unexpected(error(error_code::missing_chunk,
                                    "missing chunk " + std::to_string(i), i));
        }
    }

    auto started = std::chrono::steady_clock::now();
    auto writer = output_->begin();
    if (!writer) {
        return unexpected(writer.error());
    }
    auto& out = *writer.value();

    sha256_hasher hasher;
    for (uint32_t i = 0; i < total_chunks; ++i) {
        auto part = temp_->read(chunk_key(session.session_id, i));
        if (!part) {
            out.discard();
            auto err = part.error();
            err.chunk_index = i;
            return unexpected(std::move(err));
        }
        if (auto r = out.append(part.value()); !r) {
            out.discard();
            return unexpected(r.error());
        }
        if (auto r = hasher.update(part.value()); !r) {
            out.discard();
            return unexpected(r.error());
        }
        if ((i + 1) % progress_log_interval == 0 && i + 1 < total_chunks) {
            ctx.chunk_index = i;
            ctx.bytes_sent = out.bytes_written();
            CU_LOG_INFO_CTX(log_category::assembler, "Assembly progress", ctx);
        }
    }

    if (out.bytes_written() != session.declared_size) {
        out.discard();
        return unexpected(error(error_code::size_mismatch,
                                "assembled " + std::to_string(out.bytes_written()) +
                                    " bytes, expected " +
                                    std::to_string(session.declared_size)));
    }

    auto digest = hasher.finish();
    if (!digest) {
        out.discard();
        return unexpected(digest.error());
    }

    auto sanitized = sanitize_object_name(object_name);
    auto final_path = out.commit(sanitized);
    if (!final_path) {
        out.discard();
        return unexpected(final_path.error());
    }

    entry->closed = true;
    if (auto r = temp_->remove_area(session.session_id); !r) {
        ctx.error_message = r.error().message;
        CU_LOG_WARN_CTX(log_category::assembler, "Temp area cleanup failed", ctx);
    }
    registry_->remove(session.session_id);

    finalize_response response;
    response.ok = true;
    response.final_path = final_path.value();
    response.original_name = object_name;
    response.sanitized_name = sanitized;
    response.size = out.bytes_written();
    response.sha256 = std::move(digest.value());

    ctx.chunk_index.reset();
    ctx.object_size = response.size;
    ctx.path = response.final_path.string();
    ctx.duration_ms = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started).count());
    ctx.error_message.reset();
    CU_LOG_INFO_CTX(log_category::assembler,
                    "Object assembled as '" + sanitized + "'", ctx);
    return response;
}

}  // namespace kcenon::chunked_upload
