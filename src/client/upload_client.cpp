/**
 * @file upload_client.cpp
 * @brief Upload client implementation
 */

#include "kcenon/chunked_upload/client/upload_client.h"

#include "kcenon/chunked_upload/adapters/thread_pool_adapter.h"
#include "kcenon/chunked_upload/core/logging.h"
#include "kcenon/chunked_upload/core/transfer_plan.h"

#include <algorithm>
#include <exception>
#include <future>

namespace kcenon::chunked_upload {

struct upload_client::impl {
    std::shared_ptr<upload_transport> transport;
    client_config config;

    impl(std::shared_ptr<upload_transport> t, client_config cfg)
        : transport(std::move(t)), config(std::move(cfg)) {}

    auto make_scheduler(const std::string& object_name) -> std::shared_ptr<transfer_scheduler> {
        auto scheduler = std::make_shared<transfer_scheduler>(transport, config.retry);
        if (config.progress_callback) {
            scheduler->on_progress(
                [callback = config.progress_callback, object_name](const transfer_progress& p) {
                    callback(object_name, p);
                });
        }
        return scheduler;
    }

    auto launch(std::shared_ptr<chunk_source> source,
                init_response init,
                const std::string& object_name) -> result<std::shared_ptr<transfer_scheduler>> {
        auto plan = plan_transfer(source->size());
        if (config.chunk_size_override) {
            init.recommended_chunk_size = *config.chunk_size_override;
        }

        upload_log_context ctx;
        ctx.session_id = init.session_id;
        ctx.object_name = object_name;
        ctx.object_size = plan.object_size;
        ctx.total_chunks = static_cast<uint32_t>(
            plan.with_chunk_size(init.recommended_chunk_size).chunk_count());
        CU_LOG_DEBUG_CTX(log_category::client,
                         "Planned " + std::to_string(plan.concurrency) + " worker(s), " +
                             std::to_string(plan.max_retries) + " retries per chunk",
                         ctx);

        auto scheduler = make_scheduler(object_name);
        if (auto started = scheduler->start(std::move(source), plan, init, object_name);
            !started) {
            return unexpected(started.error());
        }
        return scheduler;
    }
};

namespace {

[[nodiscard]] auto check_source(const std::shared_ptr<chunk_source>& source,
                                const std::string& object_name) -> result<void> {
    if (!source) {
        return unexpected(error(error_code::invalid_argument, "no source"));
    }
    if (object_name.empty()) {
        return unexpected(error(error_code::invalid_argument, "object name is empty"));
    }
    if (source->size() == 0) {
        return unexpected(error(error_code::invalid_argument,
                                "object '" + object_name + "' is empty"));
    }
    return {};
}

}  // namespace

// Builder implementation
upload_client::builder::builder() = default;

auto upload_client::builder::with_transport(std::shared_ptr<upload_transport> transport)
    -> builder& {
    transport_ = std::move(transport);
    return *this;
}

auto upload_client::builder::with_retry_config(retry_config config) -> builder& {
    config_.retry = config;
    return *this;
}

auto upload_client::builder::with_chunk_size_override(uint32_t size) -> builder& {
    config_.chunk_size_override = size;
    return *this;
}

auto upload_client::builder::with_default_mime_type(std::string mime_type) -> builder& {
    config_.default_mime_type = std::move(mime_type);
    return *this;
}

auto upload_client::builder::with_progress_callback(
    std::function<void(const std::string&, const transfer_progress&)> callback) -> builder& {
    config_.progress_callback = std::move(callback);
    return *this;
}

auto upload_client::builder::build() -> result<upload_client> {
    if (!transport_) {
        return unexpected(error(error_code::invalid_argument, "transport is required"));
    }
    if (config_.chunk_size_override && *config_.chunk_size_override == 0) {
        return unexpected(error(error_code::invalid_argument, "chunk size override must be positive"));
    }
    if (config_.retry.base_delay.count() < 0 || config_.retry.large_object_extra_delay.count() < 0) {
        return unexpected(error(error_code::invalid_argument, "retry delays must not be negative"));
    }

    get_logger().initialize();
    return upload_client(transport_, config_);
}

upload_client::upload_client(std::shared_ptr<upload_transport> transport, client_config config)
    : impl_(std::make_unique<impl>(std::move(transport), std::move(config))) {}

upload_client::upload_client(upload_client&&) noexcept = default;
auto upload_client::operator=(upload_client&&) noexcept -> upload_client& = default;
upload_client::~upload_client() = default;

auto upload_client::start_upload(std::shared_ptr<chunk_source> source,
                                 const std::string& object_name,
                                 const std::string& mime_type)
    -> result<std::shared_ptr<transfer_scheduler>> {
    if (auto valid = check_source(source, object_name); !valid) {
        return unexpected(valid.error());
    }

    init_request request;
    request.object_name = object_name;
    request.declared_size = source->size();
    request.mime_type = mime_type.empty() ? impl_->config.default_mime_type : mime_type;

    auto init = impl_->transport->init_session(request);
    if (!init) {
        upload_log_context ctx;
        ctx.object_name = object_name;
        ctx.object_size = request.declared_size;
        ctx.error_message = init.error().message;
        CU_LOG_ERROR_CTX(log_category::client, "Session initialization failed", ctx);
        return unexpected(init.error());
    }

    return impl_->launch(std::move(source), std::move(init).value(), object_name);
}

auto upload_client::resume_upload(const std::string& session_id,
                                  std::shared_ptr<chunk_source> source,
                                  const std::string& object_name)
    -> result<std::shared_ptr<transfer_scheduler>> {
    if (auto valid = check_source(source, object_name); !valid) {
        return unexpected(valid.error());
    }

    auto init = impl_->transport->resume_session(session_id);
    if (!init) {
        upload_log_context ctx;
        ctx.session_id = session_id;
        ctx.object_name = object_name;
        ctx.error_message = init.error().message;
        CU_LOG_ERROR_CTX(log_category::client, "Session resume failed", ctx);
        return unexpected(init.error());
    }

    return impl_->launch(std::move(source), std::move(init).value(), object_name);
}

auto upload_client::upload(std::shared_ptr<chunk_source> source,
                           const std::string& object_name,
                           const std::string& mime_type) -> result<upload_result> {
    auto started = start_upload(std::move(source), object_name, mime_type);
    if (!started) {
        return unexpected(started.error());
    }

    auto scheduler = started.value();
    auto final_state = scheduler->wait();

    switch (final_state.status) {
        case transfer_status::done: {
            upload_result outcome;
            outcome.object_name = object_name;
            outcome.session_id = scheduler->session_id();
            outcome.response = scheduler->finalize_result().value_or(finalize_response{});
            outcome.progress = final_state;
            return outcome;
        }
        case transfer_status::error:
            return unexpected(final_state.last_error.value_or(
                error(error_code::internal_error, "upload failed")));
        default:
            return unexpected(error(error_code::transfer_cancelled, "upload cancelled"));
    }
}

auto upload_client::upload_file(const std::filesystem::path& path,
                                const std::string& object_name) -> result<upload_result> {
    auto source = file_chunk_source::open(path);
    if (!source) {
        return unexpected(source.error());
    }
    auto name = object_name.empty() ? path.filename().string() : object_name;
    return upload(source.value(), name);
}

auto upload_client::upload_batch(const std::vector<batch_upload_item>& items,
                                 const batch_options& options)
    -> std::vector<result<upload_result>> {
    std::vector<result<upload_result>> results(items.size());
    if (items.empty()) {
        return results;
    }

    auto workers = std::clamp<std::size_t>(options.max_concurrent, 1, items.size());
    auto pool = adapters::transfer_pool_factory::create(workers, "chunked_upload_batch");

    std::vector<std::future<void>> pending;
    pending.reserve(items.size());
    for (std::size_t i = 0; i < items.size(); ++i) {
        pending.push_back(pool->submit([this, &items, &results, i] {
            const auto& item = items[i];
            results[i] = upload(item.source, item.object_name, item.mime_type);
        }));
    }

    std::size_t succeeded = 0;
    for (std::size_t i = 0; i < pending.size(); ++i) {
        try {
            pending[i].get();
        } catch (const std::exception& e) {
            results[i] = unexpected(error(error_code::internal_error, e.what()));
        }
        if (results[i]) {
            ++succeeded;
        }
    }
    pool->shutdown();

    CU_LOG_INFO(log_category::client,
                "Batch finished: " + std::to_string(succeeded) + "/" +
                    std::to_string(items.size()) + " object(s) uploaded");
    return results;
}

auto upload_client::config() const -> const client_config& {
    return impl_->config;
}

}  // namespace kcenon::chunked_upload
