#include "logship.h"
#include "s3.object.store.hh"
#include "unit.test.macros.hh"

#include <atomic>
#include <chrono>
#include <cstring>
#include <thread>

using namespace std::chrono_literals;

namespace {
// nothing listens on port 1
const char* unreachable_endpoint = "http://127.0.0.1:1";

struct FlushSink
{
    std::atomic<bool> done{ false };
    std::atomic<LogShipStatusCode> status{ LogShipStatusCodeCount };
};

void
record_flush(LogShipStatusCode status,
             const char* /* object_key */,
             const char* /* etag */,
             void* user_data)
{
    auto* sink = static_cast<FlushSink*>(user_data);
    sink->status = status;
    sink->done = true;
}
} // namespace

int
main()
{
    int retval = 1;
    LogShipStream* stream = nullptr;

    try {
        logship::S3Settings settings{
            .endpoint = unreachable_endpoint,
            .bucket_name = "logs-bucket",
            .access_key_id = "access",
            .secret_access_key = "secret",
            .region = "",
        };

        // construction does not depend on listing or heading the bucket
        auto pool = std::make_shared<logship::S3ConnectionPool>(1, settings);
        logship::S3ObjectStore store(settings.bucket_name, pool);

        const std::string text = "line\n";
        logship::PutObjectRequest request{
            .bucket_name = settings.bucket_name,
            .object_key = "logs/object.log",
            .body = { reinterpret_cast<const std::byte*>(text.data()),
                      reinterpret_cast<const std::byte*>(text.data()) +
                        text.size() },
        };

        bool threw = false;
        try {
            (void)store.put_object(request);
        } catch (const std::runtime_error&) {
            threw = true;
        }
        CHECK(threw);

        // the connection went back to the pool after the failure
        auto connection = pool->get_connection();
        CHECK(connection);
        pool->return_connection(std::move(connection));

        // the stream is created, and the failed put surfaces from the flush
        LogShipS3Settings s3_settings{
            .endpoint = unreachable_endpoint,
            .bucket_name = "logs-bucket",
            .access_key_id = "access",
            .secret_access_key = "secret",
            .region = nullptr,
        };

        LogShipStreamSettings stream_settings;
        std::memset(&stream_settings, 0, sizeof(stream_settings));
        stream_settings.s3_settings = &s3_settings;
        stream_settings.upload_delay_ms = 60000;

        stream = LogShipStream_create(&stream_settings);
        CHECK(stream);

        size_t bytes_out = 0;
        CHECK_OK(
          LogShipStream_write(stream, text.data(), text.size(), &bytes_out));

        FlushSink sink;
        CHECK_OK(LogShipStream_flush(stream, false, record_flush, &sink));
        const auto deadline = std::chrono::steady_clock::now() + 30s;
        while (!sink.done && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(10ms);
        }
        CHECK(sink.done);
        CHECK(sink.status.load() == LogShipStatusCode_UploadError);

        // the final flush fails too, and says so
        CHECK(LogShipStream_finalize(stream) == LogShipStatusCode_UploadError);

        retval = 0;
    } catch (const std::exception& e) {
        LOG_ERROR("Caught exception: ", e.what());
    }

    LogShipStream_destroy(stream);
    return retval;
}
