#pragma once

#include "accumulator.hh"
#include "flush.timer.hh"
#include "logship.types.h"
#include "object.store.hh"
#include "stream.config.hh"
#include "flush.lane.hh"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <span>
#include <string>

namespace logship {
struct FlushResult
{
    LogShipStatusCode status{ LogShipStatusCode_Success };
    std::string object_key; /* key the payload was put under */
    std::string etag;
    std::string error; /* nonempty if and only if status is not Success */
    bool rotated{ false };
    size_t bytes_uploaded{ 0 };
};

using FlushCallback = std::function<void(const FlushResult&)>;
using ErrorCallback = std::function<void(const std::string&)>;

/**
 * @brief Buffers writes and uploads them to an object store, rotating to a
 * new object on a time or size boundary.
 *
 * @details Every write is appended to the current epoch's buffer. A write
 * flushes immediately if the last flush is older than the upload delay or
 * the unwritten bytes exceed the buffer size, otherwise it (re)arms a
 * delayed flush.
 *
 * A flush uploads the whole buffer of the epoch to the current key,
 * replacing the object. If the epoch is older than the rotation period, the
 * buffer exceeds the maximum file size, or rotation is forced, a successful
 * upload closes the epoch: the uploaded chunks are dropped and a new key is
 * derived. A failed upload leaves the key and the buffer as they were and
 * restores the unwritten byte count, so the next flush retries the data.
 *
 * All flushes run on a single worker thread, one at a time.
 */
class UploadCoordinator
{
  public:
    /**
     * @param config The stream configuration. The name format must be set.
     * @param store The destination of uploaded objects.
     * @param error_handler Called with a diagnostic message whenever a flush
     * fails. May be empty.
     */
    UploadCoordinator(const StreamConfig& config,
                      std::shared_ptr<ObjectStore> store,
                      ErrorCallback error_handler);
    ~UploadCoordinator() noexcept;

    /**
     * @brief Accept @p data into the buffer and apply the flush policy.
     * @details Never waits on an upload.
     * @return The number of bytes accepted.
     */
    size_t write(std::span<const std::byte> data);

    /**
     * @brief Queue a flush.
     * @param force_rotate Start a new object after a successful upload,
     * regardless of the epoch's age and size.
     * @param callback Called on the flush thread when the flush completes.
     * @return False if the coordinator has been finalized.
     */
    [[nodiscard]] bool flush(bool force_rotate, FlushCallback&& callback = {});

    /// @brief Queue a flush that starts a new object on success.
    [[nodiscard]] bool flush_file(FlushCallback&& callback = {});

    /**
     * @brief Flush the buffer to the current object and wait for all queued
     * flushes to complete.
     * @note After calling this function, writes are no longer accepted.
     * Calling it again returns the status of the first call. It must not be
     * called from a flush or error callback; doing so is refused with
     * LogShipStatusCode_InternalError.
     * @return The status of the final flush.
     */
    LogShipStatusCode finalize();

    /// @brief True if called from the thread flush callbacks run on.
    [[nodiscard]] bool is_flush_thread() const;

    [[nodiscard]] std::string current_key() const;
    [[nodiscard]] std::chrono::system_clock::time_point epoch_created_at()
      const;
    [[nodiscard]] size_t unwritten_bytes() const;
    [[nodiscard]] size_t buffered_bytes() const;

  private:
    using Clock = std::chrono::system_clock;

    struct RollbackSnapshot
    {
        size_t unwritten_bytes{ 0 };
        std::string object_key;
        size_t chunks_in_epoch{ 0 }; /* nonzero only when rotating */
    };

    const StreamConfig config_;
    const ObjectMetadata metadata_;
    std::shared_ptr<ObjectStore> store_;
    ErrorCallback error_handler_;

    mutable std::mutex mutex_;
    Accumulator accumulator_;
    std::string current_key_;
    Clock::time_point epoch_created_at_;
    Clock::time_point last_flush_at_;
    bool is_finalized_{ false };
    LogShipStatusCode final_status_{ LogShipStatusCode_InternalError };

    std::atomic<bool> flush_queued_{ false };

    std::unique_ptr<FlushTimer> timer_;
    std::unique_ptr<FlushLane> flush_lane_;

    /// @brief Start a new epoch at @p now. Caller holds mutex_.
    void new_epoch_(Clock::time_point now);

    /// @brief Queue an automatic flush unless one is already queued.
    void schedule_flush_();

    [[nodiscard]] bool enqueue_flush_(bool force_rotate,
                                      bool automatic,
                                      FlushCallback&& callback);

    /// @brief Run one flush attempt. Called on the flush lane only.
    FlushResult flush_(bool force_rotate, bool automatic);

    /// @brief Undo the bookkeeping of a failed attempt. Caller holds mutex_.
    void restore_(const RollbackSnapshot& snapshot);
};
} // namespace logship
