#pragma once

#include "logship.h"
#include "object.store.hh"
#include "stream.config.hh"
#include "upload.coordinator.hh"

#include <cstddef> // size_t
#include <memory>  // unique_ptr, shared_ptr
#include <string>

struct LogShipStream_s
{
  public:
    /**
     * @brief Create a stream that uploads to the S3 bucket named in
     * @p settings.
     * @throws std::runtime_error if the settings are invalid or the bucket
     * cannot be reached.
     */
    explicit LogShipStream_s(const struct LogShipStreamSettings_s* settings);

    /**
     * @brief Create a stream that uploads to @p store.
     * @throws std::runtime_error if the settings are invalid.
     */
    LogShipStream_s(const struct LogShipStreamSettings_s* settings,
                    std::shared_ptr<logship::ObjectStore> store);

    ~LogShipStream_s() noexcept;

    /**
     * @brief Write data to the stream.
     * @param data The data to write.
     * @param nbytes The number of bytes to write.
     * @return The number of bytes accepted.
     */
    size_t write(const void* data, size_t nbytes);

    /**
     * @brief Queue a flush, rotating to a new object if @p force_rotate is set
     * or a rotation boundary has been reached.
     * @return False if the flush could not be queued.
     */
    [[nodiscard]] bool flush(bool force_rotate,
                             logship::FlushCallback&& callback);

    /**
     * @brief Queue a flush that starts a new object on success.
     * @return False if the flush could not be queued.
     */
    [[nodiscard]] bool flush_file(logship::FlushCallback&& callback);

    /**
     * @brief Flush buffered data and wait for all uploads to complete.
     * @return The status of the final flush.
     */
    LogShipStatusCode finalize();

    /// @brief True if called from a flush or error callback.
    [[nodiscard]] bool is_flush_thread() const;

    [[nodiscard]] std::string object_key() const;

    [[nodiscard]] const logship::StreamConfig& config() const;

  private:
    std::string error_; // error message. If nonempty, an error occurred.

    logship::StreamConfig config_;
    LogShipErrorCallback error_callback_;
    void* error_callback_user_data_;

    std::unique_ptr<logship::UploadCoordinator> coordinator_;

    /**
     * @brief Copy settings to the stream, resolving defaults.
     * @param settings Struct containing settings to copy.
     */
    void commit_settings_(const struct LogShipStreamSettings_s* settings);

    /**
     * @brief Set an error message.
     * @param msg The error message to set.
     */
    void set_error_(const std::string& msg);

    /** @brief Connect to the bucket. */
    [[nodiscard]] std::shared_ptr<logship::ObjectStore> create_store_();

    /** @brief Create the coordinator that owns the buffered data. */
    [[nodiscard]] bool create_coordinator_(
      std::shared_ptr<logship::ObjectStore> store);

    /** @brief Report a failed flush to the error callback, if any. */
    void notify_error_(const std::string& msg);
};

LogShipStatusCode
finalize_stream(struct LogShipStream_s* stream);
