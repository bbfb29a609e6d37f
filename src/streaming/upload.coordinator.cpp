#include "upload.coordinator.hh"
#include "macros.hh"
#include "naming.policy.hh"
#include "serializer.hh"

#include <utility>

logship::UploadCoordinator::UploadCoordinator(
  const StreamConfig& config,
  std::shared_ptr<ObjectStore> store,
  ErrorCallback error_handler)
  : config_{ config }
  , metadata_{ make_object_metadata(config) }
  , store_{ std::move(store) }
  , error_handler_{ std::move(error_handler) }
{
    EXPECT(store_, "Null pointer: store");
    EXPECT(!config_.s3.bucket_name.empty(), "Bucket name must not be empty.");
    EXPECT(!config_.name_format.empty(), "Name format must not be empty.");

    {
        std::scoped_lock lock(mutex_);
        new_epoch_(Clock::now());
    }
    LOG_DEBUG("Writing logs to ", current_key_);

    flush_lane_ = std::make_unique<FlushLane>([this](const std::string& err) {
        if (error_handler_) {
            error_handler_(err);
        }
    });
    timer_ = std::make_unique<FlushTimer>([this] { schedule_flush_(); });
}

logship::UploadCoordinator::~UploadCoordinator() noexcept
{
    // the timer feeds the flush lane, and flushes cancel the timer
    timer_->stop();
    flush_lane_.reset();
    timer_.reset();
}

size_t
logship::UploadCoordinator::write(std::span<const std::byte> data)
{
    if (data.empty()) {
        return 0;
    }

    bool flush_now = false;
    {
        std::scoped_lock lock(mutex_);
        if (is_finalized_) {
            LOG_ERROR("Cannot write ", data.size(), " bytes after finalize.");
            return 0;
        }

        accumulator_.append(data);

        timer_->cancel();
        const auto now = Clock::now();
        flush_now = now - last_flush_at_ > config_.upload_delay ||
                    accumulator_.unwritten_bytes() > config_.buffer_size;

        if (!flush_now) {
            timer_->arm(config_.upload_delay);
        }
    }

    if (flush_now) {
        schedule_flush_();
    }

    return data.size();
}

bool
logship::UploadCoordinator::flush(bool force_rotate, FlushCallback&& callback)
{
    {
        std::scoped_lock lock(mutex_);
        if (is_finalized_) {
            LOG_ERROR("Cannot flush after finalize.");
            return false;
        }
    }

    return enqueue_flush_(force_rotate, false, std::move(callback));
}

bool
logship::UploadCoordinator::flush_file(FlushCallback&& callback)
{
    return flush(true, std::move(callback));
}

LogShipStatusCode
logship::UploadCoordinator::finalize()
{
    if (flush_lane_->is_worker_thread()) {
        LOG_ERROR("Cannot finalize from a flush or error callback.");
        return LogShipStatusCode_InternalError;
    }

    {
        std::scoped_lock lock(mutex_);
        if (is_finalized_) {
            return final_status_;
        }
        is_finalized_ = true;
    }

    timer_->stop();

    LogShipStatusCode status = LogShipStatusCode_InternalError;
    if (!enqueue_flush_(false, false, [&status](const FlushResult& result) {
            status = result.status;
        })) {
        LOG_ERROR("Failed to queue the final flush.");
    }

    LOG_DEBUG("Waiting on ", flush_lane_->pending_jobs(), " queued flushes.");
    flush_lane_->await_stop();

    std::scoped_lock lock(mutex_);
    final_status_ = status;

    return status;
}

bool
logship::UploadCoordinator::is_flush_thread() const
{
    return flush_lane_->is_worker_thread();
}

std::string
logship::UploadCoordinator::current_key() const
{
    std::scoped_lock lock(mutex_);
    return current_key_;
}

std::chrono::system_clock::time_point
logship::UploadCoordinator::epoch_created_at() const
{
    std::scoped_lock lock(mutex_);
    return epoch_created_at_;
}

size_t
logship::UploadCoordinator::unwritten_bytes() const
{
    std::scoped_lock lock(mutex_);
    return accumulator_.unwritten_bytes();
}

size_t
logship::UploadCoordinator::buffered_bytes() const
{
    std::scoped_lock lock(mutex_);
    return accumulator_.total_bytes();
}

void
logship::UploadCoordinator::new_epoch_(Clock::time_point now)
{
    current_key_ = make_object_key(config_.folder, now, config_.name_format);
    epoch_created_at_ = now;
    last_flush_at_ = now;
}

void
logship::UploadCoordinator::schedule_flush_()
{
    if (flush_queued_.exchange(true)) {
        return; // coalesce with the queued flush
    }

    if (!enqueue_flush_(false, true, {})) {
        flush_queued_ = false;
    }
}

bool
logship::UploadCoordinator::enqueue_flush_(bool force_rotate,
                                           bool automatic,
                                           FlushCallback&& callback)
{
    return flush_lane_->push_job(
      [this, force_rotate, automatic, callback = std::move(callback)](
        std::string& err) {
          const FlushResult result = flush_(force_rotate, automatic);

          if (callback) {
              callback(result);
          }

          if (result.status != LogShipStatusCode_Success) {
              err = result.error;
              return false;
          }

          return true;
      });
}

logship::FlushResult
logship::UploadCoordinator::flush_(bool force_rotate, bool automatic)
{
    RollbackSnapshot snapshot;
    std::vector<Chunk> chunks;
    bool rotating = false;

    {
        std::scoped_lock lock(mutex_);
        if (automatic) {
            flush_queued_ = false;
        }

        timer_->cancel();
        const auto now = Clock::now();
        last_flush_at_ = now;

        snapshot.unwritten_bytes = accumulator_.take_unwritten();
        snapshot.object_key = current_key_;

        const auto elapsed = now - epoch_created_at_;
        rotating = force_rotate || elapsed > config_.rotate_every ||
                   accumulator_.total_bytes() > config_.max_file_size;
        if (rotating) {
            snapshot.chunks_in_epoch = accumulator_.chunk_count();
        }

        chunks = accumulator_.chunks();
    }

    FlushResult result;
    result.object_key = snapshot.object_key;

    if (!chunks.empty()) {
        LOG_DEBUG("Flushing ",
                  chunks.size(),
                  " chunks to ",
                  snapshot.object_key,
                  rotating ? " (rotating)" : "");

        std::vector<std::byte> payload;
        try {
            payload = prepare_payload(chunks, config_);
        } catch (const std::exception& exc) {
            result.status = LogShipStatusCode_CompressionError;
            result.error = "Failed to prepare payload for " +
                           snapshot.object_key + ": " + exc.what();
        }

        if (result.status == LogShipStatusCode_Success) {
            result.bytes_uploaded = payload.size();

            PutObjectRequest request{
                .bucket_name = config_.s3.bucket_name,
                .object_key = snapshot.object_key,
                .body = std::move(payload),
                .metadata = metadata_,
            };

            try {
                result.etag = store_->put_object(request).etag;
            } catch (const std::exception& exc) {
                result.status = LogShipStatusCode_UploadError;
                result.error = "Failed to upload " + snapshot.object_key +
                               ": " + exc.what();
                result.bytes_uploaded = 0;
            }
        }
    }

    std::scoped_lock lock(mutex_);
    if (result.status != LogShipStatusCode_Success) {
        LOG_ERROR(result.error);
        restore_(snapshot);
        return result;
    }

    if (rotating) {
        // chunks written during the upload carry over to the new object
        accumulator_.drop_front(snapshot.chunks_in_epoch);
        new_epoch_(Clock::now());
        result.rotated = true;

        LOG_DEBUG("Rotated ", snapshot.object_key, " to ", current_key_);
    }

    return result;
}

void
logship::UploadCoordinator::restore_(const RollbackSnapshot& snapshot)
{
    accumulator_.restore_unwritten(snapshot.unwritten_bytes);

    // the buffered chunks were never dropped, so the key goes back with them
    if (snapshot.chunks_in_epoch > 0) {
        current_key_ = snapshot.object_key;
    }
}
