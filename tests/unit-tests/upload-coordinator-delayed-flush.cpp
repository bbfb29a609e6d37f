#include "upload.coordinator.hh"
#include "mock.object.store.hh"
#include "unit.test.macros.hh"

#include <thread>

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
        config.upload_delay = 50ms;

        logship::UploadCoordinator coordinator(config, store, {});

        EXPECT_EQ(size_t, coordinator.write(as_bytes("0123456789")), 10);

        // one delayed flush fires once the writes go quiet
        CHECK(store->wait_for_attempts(1, 2s));
        std::this_thread::sleep_for(300ms);
        EXPECT_EQ(size_t, store->attempts(), 1);

        auto requests = store->requests();
        EXPECT_STR_EQ(to_string(requests[0].body), "0123456789");
        EXPECT_EQ(size_t, coordinator.unwritten_bytes(), 0);

        // a burst of writes is coalesced into few uploads
        for (auto i = 0; i < 10; ++i) {
            coordinator.write(as_bytes("x"));
        }
        CHECK(store->wait_for_attempts(2, 2s));
        std::this_thread::sleep_for(300ms);
        EXPECT_LT(size_t, store->attempts(), 5);

        requests = store->requests();
        EXPECT_STR_EQ(to_string(requests.back().body),
                      "0123456789xxxxxxxxxx");

        // a write after a long quiet period flushes without waiting
        {
            auto quiet_store = std::make_shared<logship::test::MockObjectStore>();
            config.upload_delay = 500ms;
            logship::UploadCoordinator quiet(config, quiet_store, {});

            std::this_thread::sleep_for(600ms);
            quiet.write(as_bytes("late"));
            CHECK(quiet_store->wait_for_attempts(1, 250ms));

            // the next write right after waits out the delay again
            quiet.write(as_bytes("again"));
            CHECK(!quiet_store->wait_for_attempts(2, 200ms));
            CHECK(quiet_store->wait_for_attempts(2, 2s));
            EXPECT_STR_EQ(to_string(quiet_store->requests().back().body),
                          "lateagain");
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Caught exception: ", e.what());
        retval = 1;
    }

    return retval;
}
