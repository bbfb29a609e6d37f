#include "upload.coordinator.hh"
#include "mock.object.store.hh"
#include "unit.test.macros.hh"

#include <future>
#include <thread>

using namespace std::chrono_literals;
using logship::test::as_bytes;
using logship::test::to_string;

namespace {
logship::FlushResult
flush_and_wait(logship::UploadCoordinator& coordinator, bool force_rotate)
{
    std::promise<logship::FlushResult> promise;
    auto future = promise.get_future();
    CHECK(coordinator.flush(
      force_rotate,
      [&promise](const logship::FlushResult& r) { promise.set_value(r); }));

    EXPECT(future.wait_for(2s) == std::future_status::ready,
           "Timed out waiting for flush");
    return future.get();
}
} // namespace

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
        config.rotate_every = 100ms;

        logship::UploadCoordinator coordinator(config, store, {});
        const auto first_key = coordinator.current_key();
        const auto first_epoch = coordinator.epoch_created_at();

        coordinator.write(as_bytes("first"));
        std::this_thread::sleep_for(150ms);

        // the epoch is older than the rotation period
        auto result = flush_and_wait(coordinator, false);
        EXPECT_EQ(int, result.status, LogShipStatusCode_Success);
        CHECK(result.rotated);
        EXPECT_STR_EQ(result.object_key, first_key);
        EXPECT_STR_EQ(result.etag, "etag-1");
        CHECK(coordinator.epoch_created_at() > first_epoch);
        EXPECT_EQ(size_t, coordinator.buffered_bytes(), 0);

        // a young epoch is not rotated
        coordinator.write(as_bytes("second"));
        result = flush_and_wait(coordinator, false);
        CHECK(!result.rotated);
        EXPECT_STR_EQ(to_string(store->requests().back().body), "second");

        // keys have one-second resolution
        std::this_thread::sleep_for(1100ms);
        const auto before = coordinator.current_key();
        result = flush_and_wait(coordinator, true);
        CHECK(result.rotated);
        CHECK(coordinator.current_key() != before);
        EXPECT_STR_EQ(to_string(store->requests().back().body), "second");

        // nothing buffered: nothing is put, but the rotation still happens
        const auto puts = store->requests().size();
        result = flush_and_wait(coordinator, true);
        EXPECT_EQ(int, result.status, LogShipStatusCode_Success);
        CHECK(result.rotated);
        EXPECT_EQ(size_t, store->requests().size(), puts);

        // a large buffer rotates regardless of age
        logship::StreamConfig size_config = config;
        size_config.rotate_every = 3600s;
        size_config.max_file_size = 8;
        logship::UploadCoordinator by_size(size_config, store, {});
        by_size.write(as_bytes("0123456789"));
        result = flush_and_wait(by_size, false);
        CHECK(result.rotated);
        EXPECT_EQ(size_t, by_size.buffered_bytes(), 0);
    } catch (const std::exception& e) {
        LOG_ERROR("Caught exception: ", e.what());
        retval = 1;
    }

    return retval;
}
