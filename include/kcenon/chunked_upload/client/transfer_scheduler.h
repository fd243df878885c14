/**
 * @file transfer_scheduler.h
 * @brief Bounded-concurrency chunk sending for one object
 */

#ifndef KCENON_CHUNKED_UPLOAD_CLIENT_TRANSFER_SCHEDULER_H
#define KCENON_CHUNKED_UPLOAD_CLIENT_TRANSFER_SCHEDULER_H

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "kcenon/chunked_upload/client/chunk_source.h"
#include "kcenon/chunked_upload/client/client_types.h"
#include "kcenon/chunked_upload/client/upload_transport.h"
#include "kcenon/chunked_upload/core/protocol_types.h"
#include "kcenon/chunked_upload/core/transfer_plan.h"
#include "kcenon/chunked_upload/core/types.h"

namespace kcenon::chunked_upload {

/**
 * @brief Drives the upload of one object through a transport
 *
 * Status moves pending -> uploading -> (paused <-> uploading) ->
 * assembling -> done, with error reachable from every running state and
 * cancel() returning to pending from anywhere.
 *
 * At most plan.concurrency chunk sends are in progress at once. Each
 * worker claims the lowest pending index, reads it from the source and
 * sends it through a retry_policy. Whichever worker records the last
 * acknowledgement asks the server to finalize.
 *
 * Progress callbacks run on worker threads and on the thread calling
 * pause(), resume() or cancel(), never under the scheduler's lock. They
 * are serialized. A callback may call pause(), resume() or cancel(); it
 * must not call start() or destroy the scheduler.
 *
 * An exception thrown by the transport is reported as internal_error for
 * that send and retried like any other retryable failure.
 *
 * @code
 * transfer_scheduler scheduler(transport);
 * scheduler.on_progress([](const transfer_progress& p) {
 *     std::cout << p.percent << "%\n";
 * });
 * auto started = scheduler.start(source, plan_transfer(source->size()), init, "data.bin");
 * auto final_state = scheduler.wait();
 * @endcode
 */
class transfer_scheduler {
public:
    using progress_callback = std::function<void(const transfer_progress&)>;

    explicit transfer_scheduler(std::shared_ptr<upload_transport> transport,
                                retry_config retry = {});

    /**
     * @brief Stops the workers and waits for them; the server is not told
     */
    ~transfer_scheduler();

    transfer_scheduler(const transfer_scheduler&) = delete;
    auto operator=(const transfer_scheduler&) -> transfer_scheduler& = delete;

    /**
     * @brief Begin sending @p source into the session described by @p init
     *
     * A non-zero init.recommended_chunk_size replaces plan.chunk_size.
     * Indices in init.already_received_indices are not sent again and
     * count as sent bytes from the start.
     *
     * @return success once the workers are running, or
     *         - transfer_in_progress while uploading, paused or assembling
     *         - invalid_argument for an empty object, a source whose size
     *           differs from the plan, an invalid plan or no session
     */
    [[nodiscard]] auto start(std::shared_ptr<chunk_source> source,
                             const transfer_plan& plan,
                             const init_response& init,
                             const std::string& object_name) -> result<void>;

    /**
     * @brief Let in-flight sends finish and start no new ones
     *
     * Status becomes paused once no send is in flight.
     * @return invalid_state unless uploading
     */
    [[nodiscard]] auto pause() -> result<void>;

    /**
     * @return invalid_state unless paused
     */
    [[nodiscard]] auto resume() -> result<void>;

    /**
     * @brief Abandon the run: clear all indices, zero progress, return to pending
     *
     * Results of sends still in flight are discarded.
     */
    void cancel();

    [[nodiscard]] auto progress() const -> transfer_progress;

    void on_progress(progress_callback callback);

    /**
     * @brief Block until done, error or cancel
     */
    auto wait() -> transfer_progress;

    /**
     * @return true if done, error or cancel happened within @p timeout
     */
    [[nodiscard]] auto wait_for(std::chrono::milliseconds timeout) -> bool;

    /**
     * @brief Server answer to finalize, once done
     */
    [[nodiscard]] auto finalize_result() const -> std::optional<finalize_response>;

    /**
     * @brief Plan in effect after the server chunk size override
     */
    [[nodiscard]] auto effective_plan() const -> transfer_plan;

    [[nodiscard]] auto session_id() const -> std::string;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::chunked_upload

#endif  // KCENON_CHUNKED_UPLOAD_CLIENT_TRANSFER_SCHEDULER_H
