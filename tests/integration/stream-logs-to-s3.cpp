#include "logship.h"
#include "test.macros.hh"

#include <nlohmann/json.hpp>
#include <miniocpp/client.h>

#include <atomic>
#include <chrono>
#include <cstring>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace {
std::string s3_endpoint, s3_bucket_name, s3_access_key_id, s3_secret_access_key;

const size_t entries_before_rotation = 20, entries_after_rotation = 5;

struct FlushOutcome
{
    std::mutex mutex;
    std::atomic<bool> done{ false };
    LogShipStatusCode status{ LogShipStatusCodeCount };
    std::string object_key;
};

bool
get_credentials()
{
    char* env = nullptr;
    if (!(env = std::getenv("LOGSHIP_S3_ENDPOINT"))) {
        LOG_ERROR("LOGSHIP_S3_ENDPOINT not set.");
        return false;
    }
    s3_endpoint = env;

    if (!(env = std::getenv("LOGSHIP_S3_BUCKET_NAME"))) {
        LOG_ERROR("LOGSHIP_S3_BUCKET_NAME not set.");
        return false;
    }
    s3_bucket_name = env;

    if (!(env = std::getenv("LOGSHIP_S3_ACCESS_KEY_ID"))) {
        LOG_ERROR("LOGSHIP_S3_ACCESS_KEY_ID not set.");
        return false;
    }
    s3_access_key_id = env;

    if (!(env = std::getenv("LOGSHIP_S3_SECRET_ACCESS_KEY"))) {
        LOG_ERROR("LOGSHIP_S3_SECRET_ACCESS_KEY not set.");
        return false;
    }
    s3_secret_access_key = env;

    return true;
}

void
on_flush(LogShipStatusCode status,
         const char* object_key,
         const char* /* etag */,
         void* user_data)
{
    auto* outcome = static_cast<FlushOutcome*>(user_data);
    {
        std::scoped_lock lock(outcome->mutex);
        outcome->status = status;
        outcome->object_key = object_key;
    }
    outcome->done = true;
}

std::string
get_object_contents(minio::s3::Client& client, const std::string& object_name)
{
    std::stringstream ss;

    minio::s3::GetObjectArgs args;
    args.bucket = s3_bucket_name;
    args.object = object_name;
    args.datafunc = [&ss](minio::http::DataFunctionArgs args) -> bool {
        ss << args.datachunk;
        return true;
    };

    minio::s3::GetObjectResponse response = client.GetObject(args);
    EXPECT(response,
           "Failed to get object ",
           object_name,
           ": ",
           response.Error().String());

    return ss.str();
}

bool
remove_object(minio::s3::Client& client, const std::string& object_name)
{
    minio::s3::RemoveObjectArgs args;
    args.bucket = s3_bucket_name;
    args.object = object_name;

    minio::s3::RemoveObjectResponse response = client.RemoveObject(args);
    if (!response) {
        LOG_ERROR("Failed to delete object ",
                  object_name,
                  ": ",
                  response.Error().String());
        return false;
    }

    return true;
}

void
write_entries(LogShipStream* stream, size_t first, size_t count)
{
    for (auto i = first; i < first + count; ++i) {
        nlohmann::json entry{ { "level", "info" }, { "sequence", i } };
        const auto line = entry.dump();

        size_t bytes_out = 0;
        CHECK_OK(
          LogShipStream_write(stream, line.data(), line.size(), &bytes_out));
        CHECK(bytes_out == line.size());
    }
}

void
validate_entries(const std::string& contents, size_t first, size_t count)
{
    const auto entries = nlohmann::json::parse(contents);
    CHECK(entries.is_array());
    CHECK(entries.size() == count);

    for (auto i = 0u; i < count; ++i) {
        CHECK(entries[i]["sequence"].get<size_t>() == first + i);
        EXPECT_STR_EQ(entries[i]["level"].get<std::string>(), "info");
    }
}
} // namespace

int
main()
{
    if (!get_credentials()) {
        LOG_WARNING("Failed to get credentials. Skipping test.");
        return 0;
    }

    int retval = 1;

    LogShipS3Settings s3_settings{
        .endpoint = s3_endpoint.c_str(),
        .bucket_name = s3_bucket_name.c_str(),
        .access_key_id = s3_access_key_id.c_str(),
        .secret_access_key = s3_secret_access_key.c_str(),
        .region = nullptr,
    };

    LogShipTag tags[] = { { .key = "test", .value = TEST } };

    LogShipStreamSettings settings;
    std::memset(&settings, 0, sizeof(settings));
    settings.s3_settings = &s3_settings;
    settings.folder = TEST;
    settings.environment = "integration";
    settings.save_logs_in_json = true;
    settings.tags = tags;
    settings.tag_count = 1;

    minio::s3::BaseUrl url(s3_endpoint);
    url.https = s3_endpoint.starts_with("https://");

    minio::creds::StaticProvider provider(s3_access_key_id,
                                          s3_secret_access_key);
    minio::s3::Client client(url, &provider);

    std::vector<std::string> object_keys;
    LogShipStream* stream = nullptr;

    try {
        stream = LogShipStream_create(&settings);
        CHECK(stream);

        char key[1024];
        CHECK_OK(LogShipStream_get_object_key(stream, key, sizeof(key)));
        const std::string first_key = key;
        CHECK(first_key.starts_with(TEST "/"));
        CHECK(first_key.ends_with(".json"));
        object_keys.push_back(first_key);

        write_entries(stream, 0, entries_before_rotation);

        FlushOutcome outcome;
        CHECK_OK(LogShipStream_flush_file(stream, on_flush, &outcome));
        while (!outcome.done) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        {
            std::scoped_lock lock(outcome.mutex);
            CHECK(outcome.status == LogShipStatusCode_Success);
            EXPECT_STR_EQ(outcome.object_key, first_key);
        }

        // keys have one-minute resolution in the default format
        CHECK_OK(LogShipStream_get_object_key(stream, key, sizeof(key)));
        const std::string second_key = key;
        if (second_key != first_key) {
            object_keys.push_back(second_key);
        }

        write_entries(stream, entries_before_rotation, entries_after_rotation);
        LogShipStream_destroy(stream);
        stream = nullptr;

        if (second_key != first_key) {
            validate_entries(get_object_contents(client, first_key),
                             0,
                             entries_before_rotation);
        }
        validate_entries(get_object_contents(client, second_key),
                         entries_before_rotation,
                         entries_after_rotation);

        retval = 0;
    } catch (const std::exception& e) {
        LOG_ERROR("Caught exception: ", e.what());
    }

    // cleanup
    LogShipStream_destroy(stream);
    for (const auto& object_key : object_keys) {
        if (!remove_object(client, object_key)) {
            retval = 1;
        }
    }

    return retval;
}
