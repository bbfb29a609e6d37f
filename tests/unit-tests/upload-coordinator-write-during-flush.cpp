#include "upload.coordinator.hh"
#include "mock.object.store.hh"
#include "unit.test.macros.hh"

#include <atomic>
#include <future>

using namespace std::chrono_literals;
using logship::test::as_bytes;
using logship::test::to_string;

int
main()
{
    int retval = 0;

    try {
        auto store = std::make_shared<logship::test::MockObjectStore>();

        logship::StreamConfig config;
        config.s3.bucket_name = "logs-bucket";
        config.name_format = "%Y%m%d%H%M%S.log";
        config.upload_delay = 60s;

        logship::UploadCoordinator coordinator(config, store, {});

        EXPECT_EQ(size_t, coordinator.write(as_bytes("aaa")), 3);

        store->block_puts();

        std::promise<logship::FlushResult> promise;
        auto future = promise.get_future();
        CHECK(coordinator.flush_file(
          [&promise](const logship::FlushResult& r) { promise.set_value(r); }));

        // write while the rotating upload is in flight
        CHECK(store->wait_for_blocked(2s));
        EXPECT_EQ(size_t, coordinator.write(as_bytes("bbb")), 3);
        store->release_puts();

        EXPECT(future.wait_for(2s) == std::future_status::ready,
               "Timed out waiting for flush");
        const auto result = future.get();
        CHECK(result.status == LogShipStatusCode_Success);
        CHECK(result.rotated);

        auto requests = store->requests();
        EXPECT_EQ(size_t, requests.size(), 1);
        EXPECT_STR_EQ(to_string(requests[0].body), "aaa");

        // the late write starts the next object
        EXPECT_EQ(size_t, coordinator.buffered_bytes(), 3);
        EXPECT_EQ(size_t, coordinator.unwritten_bytes(), 3);

        // finalize is refused from a flush callback and leaves the stream open
        std::atomic<bool> ran_on_flush_thread{ false };
        std::promise<LogShipStatusCode> nested;
        auto nested_status = nested.get_future();
        CHECK(coordinator.flush(false, [&](const logship::FlushResult&) {
            ran_on_flush_thread = coordinator.is_flush_thread();
            nested.set_value(coordinator.finalize());
        }));
        EXPECT(nested_status.wait_for(2s) == std::future_status::ready,
               "Timed out waiting for flush");
        CHECK(nested_status.get() == LogShipStatusCode_InternalError);
        CHECK(ran_on_flush_thread);
        CHECK(!coordinator.is_flush_thread());

        EXPECT_EQ(size_t, coordinator.write(as_bytes("ccc")), 3);
        CHECK(coordinator.finalize() == LogShipStatusCode_Success);

        requests = store->requests();
        EXPECT_EQ(size_t, requests.size(), 3);
        EXPECT_STR_EQ(to_string(requests[1].body), "bbb");
        EXPECT_STR_EQ(to_string(requests.back().body), "bbbccc");
    } catch (const std::exception& e) {
        LOG_ERROR("Caught exception: ", e.what());
        retval = 1;
    }

    return retval;
}
