#pragma once

#include "logship.types.h"

#ifdef __cplusplus
extern "C"
{
#endif

    /**
     * @brief The settings for a log stream.
     * @details This struct contains the settings for a log stream, including
     * the S3 destination, the object naming, flush and rotation thresholds,
     * payload packaging and the per-object metadata.
     * @note Numeric thresholds left at zero select the defaults: a 20 second
     * upload delay, a 10 kB buffer, rotation every 60 minutes or at 200 kB.
     * @note The name format is an strftime pattern rendered in UTC. If it is
     * NULL or empty, a pattern encoding year, month, day, hour, minute, the
     * environment and the host name is used, e.g.
     * "2024-Jan-05-13-37-production-myhost.log.gz".
     */
    typedef struct LogShipStreamSettings_s
    {
        LogShipS3Settings* s3_settings; /**< S3 destination. Required. */
        const char* folder; /**< Key prefix. A single trailing '/' is ensured. */
        const char* name_format; /**< strftime pattern for object names. */
        const char* environment; /**< Environment for the default name format. Defaults to $LOGSHIP_ENVIRONMENT or "development". */
        LogShipTag* tags; /**< Tags attached to every object. */
        size_t tag_count; /**< The number of tags in @p tags. */
        uint64_t upload_delay_ms; /**< Quiet period before a delayed flush. */
        uint64_t buffer_size; /**< Unwritten bytes that force an immediate flush. */
        uint64_t rotate_every_ms; /**< Age of an object that forces rotation. */
        uint64_t max_file_size; /**< Object size that forces rotation. */
        bool compress; /**< Gzip-compress every uploaded object. */
        bool save_logs_in_json; /**< Package each write as an element of a JSON array. */
        const char* storage_class; /**< Optional storage class, e.g. "STANDARD_IA". */
        const char* server_side_encryption; /**< Optional SSE mode, e.g. "AES256". */
        const char* acl; /**< Optional canned ACL, e.g. "private". */
        LogShipErrorCallback error_callback; /**< Optional flush failure notification. */
        void* error_callback_user_data; /**< Passed to @p error_callback. */
    } LogShipStreamSettings;

    typedef struct LogShipStream_s LogShipStream;

    /**
     * @brief Get the version of the logship API.
     * @return The version of the logship API.
     */
    uint32_t LogShip_get_api_version();

    /**
     * @brief Set the log level for the logship API.
     * @param level The log level.
     * @return LogShipStatusCode_Success on success, or an error code on failure.
     */
    LogShipStatusCode LogShip_set_log_level(LogShipLogLevel level);

    /**
     * @brief Get the log level for the logship API.
     * @return The log level for the logship API.
     */
    LogShipLogLevel LogShip_get_log_level();

    /**
     * @brief Get the message for the given status code.
     * @param status The status code.
     * @return A human-readable status message.
     */
    const char* LogShip_get_status_message(LogShipStatusCode status);

    /**
     * @brief Create a log stream.
     * @param[in] settings The settings for the log stream.
     * @return A pointer to the log stream struct, or NULL on failure.
     */
    LogShipStream* LogShipStream_create(LogShipStreamSettings* settings);

    /**
     * @brief Destroy a log stream.
     * @details Performs one last flush of any buffered data to the current
     * object, waits for it to complete, then frees the stream. Call
     * LogShipStream_finalize first to learn whether that flush succeeded.
     * Must not be called from a flush or error callback; such a call is
     * logged and ignored.
     * @param stream The log stream struct to destroy.
     */
    void LogShipStream_destroy(LogShipStream* stream);

    /**
     * @brief Write data to the log stream.
     * @details Data is buffered in memory and this function returns
     * immediately. Upload failures are reported through the error callback,
     * never through this function.
     * @param[in, out] stream The log stream struct.
     * @param[in] data The data to write.
     * @param[in] bytes_in The number of bytes in @p data.
     * @param[out] bytes_out The number of bytes accepted by the stream.
     * @return LogShipStatusCode_Success on success, or an error code on failure.
     */
    LogShipStatusCode LogShipStream_write(LogShipStream* stream,
                                          const void* data,
                                          size_t bytes_in,
                                          size_t* bytes_out);

    /**
     * @brief Flush buffered data and start a new object.
     * @details The flush runs asynchronously; @p callback, if not NULL, is
     * called on the flush thread when it completes.
     * @param[in, out] stream The log stream struct.
     * @param[in] callback Optional completion callback.
     * @param[in] user_data Passed to @p callback.
     * @return LogShipStatusCode_Success if the flush was queued, or an error
     * code on failure.
     */
    LogShipStatusCode LogShipStream_flush_file(LogShipStream* stream,
                                               LogShipFlushCallback callback,
                                               void* user_data);

    /**
     * @brief Flush buffered data to the current object.
     * @details The flush runs asynchronously; @p callback, if not NULL, is
     * called on the flush thread when it completes. The stream rotates to a
     * new object after the upload if @p force_rotate is true or the object
     * has reached its age or size limit.
     * @param[in, out] stream The log stream struct.
     * @param[in] force_rotate Start a new object after this flush.
     * @param[in] callback Optional completion callback.
     * @param[in] user_data Passed to @p callback.
     * @return LogShipStatusCode_Success if the flush was queued, or an error
     * code on failure.
     */
    LogShipStatusCode LogShipStream_flush(LogShipStream* stream,
                                          bool force_rotate,
                                          LogShipFlushCallback callback,
                                          void* user_data);

    /**
     * @brief Flush buffered data and wait for every queued flush to finish.
     * @details After this call the stream accepts no more writes. Calling it
     * again returns the first result. Must not be called from a flush or
     * error callback.
     * @param[in, out] stream The log stream struct.
     * @return LogShipStatusCode_Success if the final flush succeeded, the
     * flush's error code (e.g. LogShipStatusCode_UploadError) if it failed, or
     * LogShipStatusCode_InternalError if called from a callback.
     */
    LogShipStatusCode LogShipStream_finalize(LogShipStream* stream);

    /**
     * @brief Get the key of the object currently being written to.
     * @param[in] stream The log stream struct.
     * @param[out] buffer Receives the NUL-terminated key.
     * @param[in] bytes_of_buffer The size of @p buffer.
     * @return LogShipStatusCode_Success on success, or
     * LogShipStatusCode_InvalidArgument if @p buffer is too small.
     */
    LogShipStatusCode LogShipStream_get_object_key(const LogShipStream* stream,
                                                   char* buffer,
                                                   size_t bytes_of_buffer);

#ifdef __cplusplus
}
#endif
