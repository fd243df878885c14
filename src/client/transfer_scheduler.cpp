/**
 * @file transfer_scheduler.cpp
 * @brief Implementation of the per-object transfer scheduler
 */

#include "kcenon/chunked_upload/client/transfer_scheduler.h"

#include "kcenon/chunked_upload/adapters/thread_pool_adapter.h"
#include "kcenon/chunked_upload/client/retry_policy.h"
#include "kcenon/chunked_upload/client/transfer_control.h"
#include "kcenon/chunked_upload/core/checksum.h"
#include "kcenon/chunked_upload/core/logging.h"

#include <algorithm>
#include <cmath>
#include <condition_variable>
#include <exception>
#include <future>
#include <mutex>
#include <set>
#include <vector>

namespace kcenon::chunked_upload {

namespace {

[[nodiscard]] auto is_valid_transition(transfer_status from, transfer_status to) noexcept
    -> bool {
    if (to == transfer_status::pending) {
        return true;
    }
    switch (from) {
        case transfer_status::pending:
        case transfer_status::done:
        case transfer_status::error:
            return to == transfer_status::uploading || to == transfer_status::assembling;
        case transfer_status::uploading:
            return to == transfer_status::paused || to == transfer_status::assembling ||
                   to == transfer_status::error;
        case transfer_status::paused:
            return to == transfer_status::uploading || to == transfer_status::assembling ||
                   to == transfer_status::error;
        case transfer_status::assembling:
            return to == transfer_status::done || to == transfer_status::error;
        default:
            return false;
    }
}

[[nodiscard]] auto is_active(transfer_status status) noexcept -> bool {
    return status == transfer_status::uploading || status == transfer_status::paused ||
           status == transfer_status::assembling;
}

}  // namespace

struct transfer_scheduler::impl {
    std::shared_ptr<upload_transport> transport;
    retry_config retry;
    transfer_control control;

    // Serializes start() against itself and the destructor
    std::mutex start_mutex;

    mutable std::mutex mutex;
    std::condition_variable settled_cv;

    std::shared_ptr<chunk_source> source;
    transfer_plan plan;
    std::string session_id;
    std::string object_name;
    uint32_t total_chunks{0};

    std::set<uint32_t> pending;
    std::vector<bool> acknowledged;
    transfer_progress progress;
    uint64_t resumed_bytes{0};
    std::chrono::steady_clock::time_point started_at;

    uint64_t generation{0};
    bool settled{true};
    std::optional<finalize_response> finalized;

    std::shared_ptr<adapters::transfer_thread_pool_interface> pool;
    std::vector<std::future<void>> workers;

    // Recursive so a callback may call pause(), resume() or cancel()
    std::recursive_mutex callback_mutex;
    progress_callback callback;

    impl(std::shared_ptr<upload_transport> t, retry_config r)
        : transport(std::move(t)), retry(r) {}

    auto log_context() const -> upload_log_context {
        upload_log_context ctx;
        ctx.session_id = session_id;
        ctx.object_name = object_name;
        ctx.object_size = plan.object_size;
        ctx.total_chunks = total_chunks;
        return ctx;
    }

    auto transition(transfer_status to) -> bool {
        if (!is_valid_transition(progress.status, to)) {
            return false;
        }
        progress.status = to;
        return true;
    }

    void settle() {
        settled = true;
        settled_cv.notify_all();
    }

    // Callbacks are serialized and always see the latest state, so
    // sent_bytes is non-decreasing across consecutive calls.
    void notify_progress() {
        std::lock_guard cb_lock(callback_mutex);
        if (!callback) {
            return;
        }
        // A callback may replace itself through on_progress().
        auto current = callback;
        transfer_progress snapshot;
        {
            std::lock_guard lock(mutex);
            snapshot = progress;
        }
        current(snapshot);
    }

    void fill_progress_fields(upload_log_context& ctx) const {
        ctx.bytes_sent = progress.sent_bytes;
        ctx.progress_percent = static_cast<double>(progress.percent);
    }

    void update_rates() {
        auto total = progress.total_bytes;
        auto sent = progress.sent_bytes;
        progress.percent = total == 0
            ? 0
            : std::min<uint32_t>(99, static_cast<uint32_t>(std::floor(
                  static_cast<long double>(sent) * 100.0L / static_cast<long double>(total))));

        auto elapsed = std::chrono::duration<double>(
            std::chrono::steady_clock::now() - started_at).count();
        auto sent_this_run = sent - std::min(sent, resumed_bytes);
        if (elapsed > 0.0 && sent_this_run > 0) {
            double speed = static_cast<double>(sent_this_run) / elapsed;
            progress.speed_bps = speed;
            progress.eta_seconds = static_cast<double>(total - sent) / speed;
        }
    }

    void join_workers() {
        std::vector<std::future<void>> running;
        {
            std::lock_guard lock(mutex);
            running.swap(workers);
        }
        for (auto& worker : running) {
            if (worker.valid()) {
                worker.wait();
            }
        }
    }

    void fail(uint64_t gen, error err) {
        upload_log_context ctx;
        {
            std::lock_guard lock(mutex);
            if (gen != generation || !transition(transfer_status::error)) {
                return;
            }
            progress.last_error = err;
            pending.clear();
            control.cancel();
            settle();
            ctx = log_context();
            fill_progress_fields(ctx);
        }
        if (err.chunk_index) {
            ctx.chunk_index = *err.chunk_index;
        }
        ctx.error_message = err.message;
        CU_LOG_ERROR_CTX(log_category::scheduler, "Upload failed", ctx);
        notify_progress();
    }

    void mark_paused_if_idle(uint64_t gen) {
        upload_log_context ctx;
        {
            std::lock_guard lock(mutex);
            if (gen != generation || progress.status != transfer_status::uploading ||
                !control.is_paused()) {
                return;
            }
            transition(transfer_status::paused);
            ctx = log_context();
            fill_progress_fields(ctx);
        }
        CU_LOG_INFO_CTX(log_category::scheduler, "Upload paused", ctx);
        notify_progress();
    }

    auto send_once(uint64_t gen,
                   const std::string& session,
                   uint32_t index,
                   const byte_buffer& data,
                   uint32_t crc) -> result<void> {
        if (!control.begin_send()) {
            return unexpected(error(error_code::transfer_cancelled, "transfer cancelled", index));
        }
        result<put_chunk_response> stored;
        try {
            stored = transport->put_chunk(session, index, data, crc);
        } catch (const std::exception& e) {
            stored = unexpected(error(error_code::internal_error,
                                      std::string("transport threw: ") + e.what(), index));
        } catch (...) {
            stored = unexpected(error(error_code::internal_error,
                                      "transport threw an unknown exception", index));
        }
        if (control.end_send()) {
            mark_paused_if_idle(gen);
        }
        if (!stored) {
            return unexpected(stored.error());
        }
        return {};
    }

    // Returns true when this acknowledgement completed the object.
    auto record_ack(uint64_t gen, uint32_t index, uint64_t length) -> bool {
        bool complete = false;
        {
            std::lock_guard lock(mutex);
            if (gen != generation || is_terminal(progress.status) ||
                index >= acknowledged.size() || acknowledged[index]) {
                return false;
            }
            acknowledged[index] = true;
            ++progress.acknowledged_chunks;
            progress.sent_bytes += length;
            update_rates();
            complete = progress.acknowledged_chunks == total_chunks;
        }
        notify_progress();
        return complete;
    }

    void run_finalize(uint64_t gen) {
        if (!control.wait_while_paused()) {
            return;
        }

        std::string session;
        std::string name;
        uint32_t chunks = 0;
        {
            std::lock_guard lock(mutex);
            if (gen != generation || !transition(transfer_status::assembling)) {
                return;
            }
            session = session_id;
            name = object_name;
            chunks = total_chunks;
        }
        notify_progress();

        result<finalize_response> assembled;
        try {
            assembled = transport->finalize(session, chunks, name);
        } catch (const std::exception& e) {
            assembled = unexpected(error(error_code::internal_error,
                                         std::string("transport threw: ") + e.what()));
        } catch (...) {
            assembled = unexpected(error(error_code::internal_error,
                                         "transport threw an unknown exception"));
        }

        upload_log_context ctx;
        {
            std::lock_guard lock(mutex);
            if (gen != generation) {
                return;
            }
            ctx = log_context();
            if (assembled) {
                transition(transfer_status::done);
                finalized = assembled.value();
                progress.sent_bytes = progress.total_bytes;
                progress.percent = 100;
                progress.eta_seconds = 0.0;
                fill_progress_fields(ctx);
                ctx.path = assembled.value().final_path.string();
                ctx.duration_ms = static_cast<uint64_t>(
                    std::chrono::duration_cast<std::chrono::milliseconds>(
                        std::chrono::steady_clock::now() - started_at).count());
                if (progress.speed_bps) {
                    ctx.rate_mbps = *progress.speed_bps / static_cast<double>(MiB);
                }
            } else {
                transition(transfer_status::error);
                progress.last_error = assembled.error();
                ctx.error_message = assembled.error().message;
            }
            settle();
        }

        if (assembled) {
            CU_LOG_INFO_CTX(log_category::scheduler, "Upload complete", ctx);
        } else {
            CU_LOG_ERROR_CTX(log_category::scheduler, "Finalize failed", ctx);
        }
        notify_progress();
    }

    void worker_loop(uint64_t gen) {
        std::shared_ptr<chunk_source> src;
        transfer_plan active_plan;
        std::string session;
        uint32_t chunks = 0;
        {
            std::lock_guard lock(mutex);
            src = source;
            active_plan = plan;
            session = session_id;
            chunks = total_chunks;
        }
        retry_policy policy(active_plan.max_retries, chunks, retry);

        while (control.wait_while_paused()) {
            uint32_t index = 0;
            {
                std::lock_guard lock(mutex);
                if (gen != generation || is_terminal(progress.status) || pending.empty()) {
                    return;
                }
                index = *pending.begin();
                pending.erase(pending.begin());
            }

            auto range = active_plan.range_of(index);
            auto data = src->read(range.offset, range.length);
            if (!data) {
                auto err = data.error();
                err.chunk_index = index;
                fail(gen, std::move(err));
                return;
            }

            auto crc = checksum::crc32(data.value());
            auto sent = policy.execute(
                index,
                [&] { return send_once(gen, session, index, data.value(), crc); },
                control);
            if (!sent) {
                if (sent.error().code != error_code::transfer_cancelled) {
                    fail(gen, sent.error());
                }
                return;
            }

            if (record_ack(gen, index, range.length)) {
                run_finalize(gen);
                return;
            }
        }
    }

    // Stops the current run without touching progress; used by cancel and
    // destruction.
    void abandon_run() {
        {
            std::lock_guard lock(mutex);
            ++generation;
            pending.clear();
        }
        control.cancel();
    }
};

transfer_scheduler::transfer_scheduler(std::shared_ptr<upload_transport> transport,
                                       retry_config retry)
    : impl_(std::make_unique<impl>(std::move(transport), retry)) {}

transfer_scheduler::~transfer_scheduler() {
    std::lock_guard start_lock(impl_->start_mutex);
    impl_->abandon_run();
    impl_->join_workers();
    if (impl_->pool) {
        impl_->pool->shutdown();
    }
}

auto transfer_scheduler::start(std::shared_ptr<chunk_source> source,
                               const transfer_plan& plan,
                               const init_response& init,
                               const std::string& object_name) -> result<void> {
    std::lock_guard start_lock(impl_->start_mutex);

    {
        std::lock_guard lock(impl_->mutex);
        if (is_active(impl_->progress.status)) {
            return unexpected(error(error_code::transfer_in_progress,
                                    std::string("cannot start while ") +
                                        to_string(impl_->progress.status)));
        }
    }

    if (!source) {
        return unexpected(error(error_code::invalid_argument, "no source"));
    }
    if (source->size() == 0) {
        return unexpected(error(error_code::invalid_argument, "object is empty"));
    }
    if (source->size() != plan.object_size) {
        return unexpected(error(error_code::invalid_argument,
                                "source size " + std::to_string(source->size()) +
                                    " differs from planned size " +
                                    std::to_string(plan.object_size)));
    }
    if (init.session_id.empty()) {
        return unexpected(error(error_code::invalid_argument, "no upload session"));
    }

    auto effective = plan.with_chunk_size(init.recommended_chunk_size);
    if (auto valid = effective.validate(); !valid) {
        return unexpected(valid.error());
    }
    auto chunks = static_cast<uint32_t>(effective.chunk_count());

    // Workers of a cancelled or finished run may still be unwinding.
    impl_->join_workers();
    if (impl_->pool) {
        impl_->pool->shutdown();
        impl_->pool.reset();
    }

    upload_log_context ctx;
    std::size_t pending_count = 0;
    {
        std::lock_guard lock(impl_->mutex);
        if (is_active(impl_->progress.status)) {
            return unexpected(error(error_code::transfer_in_progress, "transfer started concurrently"));
        }

        impl_->source = std::move(source);
        impl_->plan = effective;
        impl_->session_id = init.session_id;
        impl_->object_name = object_name;
        impl_->total_chunks = chunks;

        impl_->acknowledged.assign(chunks, false);
        impl_->pending.clear();
        impl_->resumed_bytes = 0;
        uint32_t resumed_chunks = 0;
        for (auto index : init.already_received_indices) {
            if (index < chunks && !impl_->acknowledged[index]) {
                impl_->acknowledged[index] = true;
                impl_->resumed_bytes += effective.range_of(index).length;
                ++resumed_chunks;
            }
        }
        for (uint32_t i = 0; i < chunks; ++i) {
            if (!impl_->acknowledged[i]) {
                impl_->pending.insert(i);
            }
        }
        pending_count = impl_->pending.size();

        impl_->progress = transfer_progress{};
        impl_->progress.total_bytes = effective.object_size;
        impl_->progress.total_chunks = chunks;
        impl_->progress.acknowledged_chunks = resumed_chunks;
        impl_->progress.sent_bytes = impl_->resumed_bytes;
        impl_->started_at = std::chrono::steady_clock::now();
        impl_->update_rates();
        impl_->finalized.reset();
        impl_->settled = false;

        ++impl_->generation;
        auto gen = impl_->generation;
        impl_->control.reset();

        auto workers = std::min<std::size_t>(effective.concurrency, std::max<std::size_t>(pending_count, 1));
        impl_->pool = adapters::transfer_pool_factory::create(workers, "chunked_upload");

        // Every chunk already on the server: go straight to finalize, which
        // moves uploading to assembling itself.
        auto* state = impl_.get();
        impl_->transition(transfer_status::uploading);
        if (pending_count == 0) {
            impl_->workers.push_back(impl_->pool->submit([state, gen] { state->run_finalize(gen); }));
        } else {
            for (std::size_t i = 0; i < workers; ++i) {
                impl_->workers.push_back(
                    impl_->pool->submit([state, gen] { state->worker_loop(gen); }));
            }
        }

        ctx = impl_->log_context();
        impl_->fill_progress_fields(ctx);
    }

    CU_LOG_INFO_CTX(log_category::scheduler,
                    "Upload started with " + std::to_string(pending_count) + " pending chunk(s)",
                    ctx);
    impl_->notify_progress();
    return {};
}

auto transfer_scheduler::pause() -> result<void> {
    upload_log_context ctx;
    bool settled_now = false;
    {
        std::lock_guard lock(impl_->mutex);
        auto status = impl_->progress.status;
        if (status == transfer_status::paused ||
            (status == transfer_status::uploading && impl_->control.is_paused())) {
            return {};
        }
        if (status != transfer_status::uploading) {
            return unexpected(error(error_code::invalid_state,
                                    std::string("cannot pause while ") + to_string(status)));
        }
        settled_now = impl_->control.pause();
        if (settled_now) {
            impl_->transition(transfer_status::paused);
        }
        ctx = impl_->log_context();
        impl_->fill_progress_fields(ctx);
    }

    CU_LOG_INFO_CTX(log_category::scheduler,
                    settled_now ? "Upload paused" : "Pause requested, waiting for in-flight chunks",
                    ctx);
    if (settled_now) {
        impl_->notify_progress();
    }
    return {};
}

auto transfer_scheduler::resume() -> result<void> {
    upload_log_context ctx;
    {
        std::lock_guard lock(impl_->mutex);
        auto status = impl_->progress.status;
        bool pause_pending = status == transfer_status::uploading && impl_->control.is_paused();
        if (status != transfer_status::paused && !pause_pending) {
            return unexpected(error(error_code::invalid_state,
                                    std::string("cannot resume while ") + to_string(status)));
        }
        if (status == transfer_status::paused) {
            impl_->transition(transfer_status::uploading);
        }
        impl_->control.resume();
        ctx = impl_->log_context();
        impl_->fill_progress_fields(ctx);
    }

    CU_LOG_INFO_CTX(log_category::scheduler, "Upload resumed", ctx);
    impl_->notify_progress();
    return {};
}

void transfer_scheduler::cancel() {
    impl_->abandon_run();

    upload_log_context ctx;
    {
        std::lock_guard lock(impl_->mutex);
        std::fill(impl_->acknowledged.begin(), impl_->acknowledged.end(), false);
        impl_->resumed_bytes = 0;

        auto total_bytes = impl_->progress.total_bytes;
        auto total_chunks = impl_->progress.total_chunks;
        impl_->progress = transfer_progress{};
        impl_->progress.total_bytes = total_bytes;
        impl_->progress.total_chunks = total_chunks;
        impl_->finalized.reset();
        impl_->settle();
        ctx = impl_->log_context();
    }

    CU_LOG_INFO_CTX(log_category::scheduler, "Upload cancelled", ctx);
    impl_->notify_progress();
}

auto transfer_scheduler::progress() const -> transfer_progress {
    std::lock_guard lock(impl_->mutex);
    return impl_->progress;
}

void transfer_scheduler::on_progress(progress_callback callback) {
    std::lock_guard lock(impl_->callback_mutex);
    impl_->callback = std::move(callback);
}

auto transfer_scheduler::wait() -> transfer_progress {
    std::unique_lock lock(impl_->mutex);
    impl_->settled_cv.wait(lock, [this] { return impl_->settled; });
    return impl_->progress;
}

auto transfer_scheduler::wait_for(std::chrono::milliseconds timeout) -> bool {
    std::unique_lock lock(impl_->mutex);
    return impl_->settled_cv.wait_for(lock, timeout, [this] { return impl_->settled; });
}

auto transfer_scheduler::finalize_result() const -> std::optional<finalize_response> {
    std::lock_guard lock(impl_->mutex);
    return impl_->finalized;
}

auto transfer_scheduler::effective_plan() const -> transfer_plan {
    std::lock_guard lock(impl_->mutex);
    return impl_->plan;
}

auto transfer_scheduler::session_id() const -> std::string {
    std::lock_guard lock(impl_->mutex);
    return impl_->session_id;
}

}  // namespace kcenon::chunked_upload
