#include "logship.h"
#include "logship.stream.hh"
#include "macros.hh"

#include <cstdint> // uint32_t
#include <cstring> // memcpy
#include <new>     // std::bad_alloc

#define LOGSHIP_API_VERSION 0

namespace {
struct FlushCallbackContext
{
    LogShipFlushCallback callback;
    void* user_data;
};

logship::FlushCallback
wrap_flush_callback(LogShipFlushCallback callback, void* user_data)
{
    if (callback == nullptr) {
        return {};
    }

    return [ctx = FlushCallbackContext{ callback, user_data }](
             const logship::FlushResult& result) {
        ctx.callback(result.status,
                     result.object_key.c_str(),
                     result.etag.c_str(),
                     ctx.user_data);
    };
}
} // namespace

extern "C"
{
    uint32_t LogShip_get_api_version()
    {
        return LOGSHIP_API_VERSION;
    }

    LogShipStatusCode LogShip_set_log_level(LogShipLogLevel level)
    {
        EXPECT_VALID_ARGUMENT(
          level >= LogShipLogLevel_Debug && level < LogShipLogLevelCount,
          "Invalid log level: ",
          level);

        try {
            Logger::set_log_level(level);
        } catch (const std::exception& e) {
            LOG_ERROR("Error setting log level: ", e.what());
            return LogShipStatusCode_InternalError;
        }
        return LogShipStatusCode_Success;
    }

    LogShipLogLevel LogShip_get_log_level()
    {
        return Logger::get_log_level();
    }

    const char* LogShip_get_status_message(LogShipStatusCode code)
    {
        switch (code) {
            case LogShipStatusCode_Success:
                return "Success";
            case LogShipStatusCode_InvalidArgument:
                return "Invalid argument";
            case LogShipStatusCode_InternalError:
                return "Internal error";
            case LogShipStatusCode_OutOfMemory:
                return "Out of memory";
            case LogShipStatusCode_UploadError:
                return "Upload error";
            case LogShipStatusCode_CompressionError:
                return "Compression error";
            case LogShipStatusCode_InvalidSettings:
                return "Invalid settings";
            default:
                return "Unknown error";
        }
    }

    LogShipStream_s* LogShipStream_create(
      struct LogShipStreamSettings_s* settings)
    {
        LogShipStream_s* stream = nullptr;

        try {
            stream = new LogShipStream_s(settings);
        } catch (const std::bad_alloc&) {
            LOG_ERROR("Failed to allocate memory for log stream");
        } catch (const std::exception& e) {
            LOG_ERROR("Error creating log stream: ", e.what());
        }

        return stream;
    }

    void LogShipStream_destroy(struct LogShipStream_s* stream)
    {
        if (stream == nullptr) {
            return;
        }

        if (stream->is_flush_thread()) {
            LOG_ERROR("Cannot destroy a stream from its own flush or error "
                      "callback. The stream was not destroyed.");
            return;
        }

        if (finalize_stream(stream) != LogShipStatusCode_Success) {
            LOG_ERROR("Final flush failed. Buffered data was not uploaded.");
        }

        delete stream;
    }

    LogShipStatusCode LogShipStream_write(struct LogShipStream_s* stream,
                                          const void* data,
                                          size_t bytes_in,
                                          size_t* bytes_out)
    {
        EXPECT_VALID_ARGUMENT(stream, "Null pointer: stream");
        EXPECT_VALID_ARGUMENT(data, "Null pointer: data");
        EXPECT_VALID_ARGUMENT(bytes_out, "Null pointer: bytes_out");

        try {
            *bytes_out = stream->write(data, bytes_in);
        } catch (const std::bad_alloc&) {
            LOG_ERROR("Failed to allocate memory for ", bytes_in, " bytes");
            return LogShipStatusCode_OutOfMemory;
        } catch (const std::exception& e) {
            LOG_ERROR("Error writing data: ", e.what());
            return LogShipStatusCode_InternalError;
        }

        return LogShipStatusCode_Success;
    }

    LogShipStatusCode LogShipStream_flush_file(struct LogShipStream_s* stream,
                                               LogShipFlushCallback callback,
                                               void* user_data)
    {
        EXPECT_VALID_ARGUMENT(stream, "Null pointer: stream");

        try {
            if (!stream->flush_file(wrap_flush_callback(callback, user_data))) {
                return LogShipStatusCode_InternalError;
            }
        } catch (const std::exception& e) {
            LOG_ERROR("Error flushing stream: ", e.what());
            return LogShipStatusCode_InternalError;
        }

        return LogShipStatusCode_Success;
    }

    LogShipStatusCode LogShipStream_flush(struct LogShipStream_s* stream,
                                          bool force_rotate,
                                          LogShipFlushCallback callback,
                                          void* user_data)
    {
        EXPECT_VALID_ARGUMENT(stream, "Null pointer: stream");

        try {
            if (!stream->flush(force_rotate,
                               wrap_flush_callback(callback, user_data))) {
                return LogShipStatusCode_InternalError;
            }
        } catch (const std::exception& e) {
            LOG_ERROR("Error flushing stream: ", e.what());
            return LogShipStatusCode_InternalError;
        }

        return LogShipStatusCode_Success;
    }

    LogShipStatusCode LogShipStream_finalize(struct LogShipStream_s* stream)
    {
        EXPECT_VALID_ARGUMENT(stream, "Null pointer: stream");

        return finalize_stream(stream);
    }

    LogShipStatusCode LogShipStream_get_object_key(
      const struct LogShipStream_s* stream,
      char* buffer,
      size_t bytes_of_buffer)
    {
        EXPECT_VALID_ARGUMENT(stream, "Null pointer: stream");
        EXPECT_VALID_ARGUMENT(buffer, "Null pointer: buffer");

        std::string key;
        try {
            key = stream->object_key();
        } catch (const std::exception& e) {
            LOG_ERROR("Error getting object key: ", e.what());
            return LogShipStatusCode_InternalError;
        }

        EXPECT_VALID_ARGUMENT(bytes_of_buffer > key.size(),
                              "Buffer of ",
                              bytes_of_buffer,
                              " bytes is too small for key of ",
                              key.size(),
                              " bytes");

        std::memcpy(buffer, key.c_str(), key.size() + 1);
        return LogShipStatusCode_Success;
    }
}
