/// @file
/// @brief Ship a few hundred log lines to an S3 bucket, starting a new object
/// halfway through. Reads the endpoint, bucket and credentials from the
/// LOGSHIP_S3_* environment variables.

#include "logship.h"

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <thread>

namespace {
const char*
require_env(const char* name)
{
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        fprintf(stderr, "%s is not set\n", name);
        std::exit(1);
    }
    return value;
}

void
on_error(const char* message, void* /* user_data */)
{
    fprintf(stderr, "upload failed: %s\n", message);
}

void
on_flush(LogShipStatusCode status,
         const char* object_key,
         const char* etag,
         void* /* user_data */)
{
    fprintf(stdout,
            "flushed %s (%s): %s\n",
            object_key,
            etag,
            LogShip_get_status_message(status));
}
} // namespace

int
main()
{
    LogShipS3Settings s3_settings{
        .endpoint = require_env("LOGSHIP_S3_ENDPOINT"),
        .bucket_name = require_env("LOGSHIP_S3_BUCKET_NAME"),
        .access_key_id = require_env("LOGSHIP_S3_ACCESS_KEY_ID"),
        .secret_access_key = require_env("LOGSHIP_S3_SECRET_ACCESS_KEY"),
        .region = nullptr,
    };

    LogShipTag tags[] = { { .key = "service", .value = "example" } };

    LogShipStreamSettings settings;
    memset(&settings, 0, sizeof(settings));
    settings.s3_settings = &s3_settings;
    settings.folder = "examples/stream-logs";
    settings.tags = tags;
    settings.tag_count = 1;
    settings.upload_delay_ms = 500;
    settings.buffer_size = 4096;
    settings.compress = true;
    settings.error_callback = on_error;

    if (LogShip_set_log_level(LogShipLogLevel_Info) !=
        LogShipStatusCode_Success) {
        fprintf(stderr, "Failed to set log level\n");
    }

    LogShipStream* stream = LogShipStream_create(&settings);
    if (stream == nullptr) {
        fprintf(stderr, "Failed to create log stream\n");
        return 1;
    }

    char key[1024];
    if (LogShipStream_get_object_key(stream, key, sizeof(key)) ==
        LogShipStatusCode_Success) {
        fprintf(stdout, "writing to %s\n", key);
    }

    for (auto i = 0; i < 400; ++i) {
        const std::string line =
          "request " + std::to_string(i) + " handled in " +
          std::to_string(5 + i % 17) + "ms\n";

        size_t bytes_out = 0;
        const auto status =
          LogShipStream_write(stream, line.data(), line.size(), &bytes_out);
        if (status != LogShipStatusCode_Success) {
            fprintf(stderr,
                    "write failed: %s\n",
                    LogShip_get_status_message(status));
            break;
        }

        if (i == 200 && LogShipStream_flush_file(stream, on_flush, nullptr) !=
                          LogShipStatusCode_Success) {
            fprintf(stderr, "Failed to start a new object\n");
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    // uploads whatever is still buffered
    LogShipStream_destroy(stream);

    return 0;
}
