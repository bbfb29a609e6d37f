#include "macros.hh"
#include "s3.connection.hh"

#include <miniocpp/utils.h>

#include <istream>
#include <string_view>

namespace {
constexpr std::string_view default_endpoint = "https://s3.amazonaws.com";
} // namespace

logship::S3Connection::S3Connection(const S3Settings& settings)
{
    const std::string endpoint = settings.endpoint.empty()
                                   ? std::string(default_endpoint)
                                   : settings.endpoint;

    minio::s3::BaseUrl url(endpoint);
    url.https = endpoint.starts_with("https");
    if (!settings.region.empty()) {
        url.region = settings.region;
    }

    provider_ = std::make_unique<minio::creds::StaticProvider>(
      settings.access_key_id, settings.secret_access_key);
    client_ = std::make_unique<minio::s3::Client>(url, provider_.get());

    CHECK(client_);
}

bool
logship::S3Connection::is_connection_valid()
{
    return static_cast<bool>(client_->ListBuckets());
}

bool
logship::S3Connection::bucket_exists(std::string_view bucket_name)
{
    minio::s3::BucketExistsArgs args;
    args.bucket = bucket_name;

    auto response = client_->BucketExists(args);
    return response.exist;
}

bool
logship::S3Connection::object_exists(std::string_view bucket_name,
                                     std::string_view object_name)
{
    minio::s3::StatObjectArgs args;
    args.bucket = bucket_name;
    args.object = object_name;

    auto response = client_->StatObject(args);
    // casts to true if response code in 200 range and error message is empty
    return static_cast<bool>(response);
}

logship::PutObjectResult
logship::S3Connection::put_object(const PutObjectRequest& request)
{
    EXPECT(!request.bucket_name.empty(), "Bucket name must not be empty.");
    EXPECT(!request.object_key.empty(), "Object name must not be empty.");
    EXPECT(!request.body.empty(), "Data must not be empty.");

    minio::utils::CharBuffer buffer(
      reinterpret_cast<char*>(const_cast<std::byte*>(request.body.data())),
      request.body.size());
    std::basic_istream stream(&buffer);

    LOG_DEBUG("Putting object ",
              request.object_key,
              " (",
              request.body.size(),
              " bytes) in bucket ",
              request.bucket_name);
    minio::s3::PutObjectArgs args(
      stream, static_cast<long>(request.body.size()), 0);
    args.bucket = request.bucket_name;
    args.object = request.object_key;

    const auto& metadata = request.metadata;
    if (metadata.tagging) {
        args.headers.Add("x-amz-tagging", *metadata.tagging);
    }
    if (metadata.storage_class) {
        args.headers.Add("x-amz-storage-class", *metadata.storage_class);
    }
    if (metadata.server_side_encryption) {
        args.headers.Add("x-amz-server-side-encryption",
                         *metadata.server_side_encryption);
    }
    if (metadata.acl) {
        args.headers.Add("x-amz-acl", *metadata.acl);
    }
    if (metadata.content_type) {
        args.content_type = *metadata.content_type;
    }

    auto response = client_->PutObject(args);
    EXPECT(response,
           "Failed to put object ",
           request.object_key,
           " in bucket ",
           request.bucket_name,
           ": ",
           response.Error().String());

    return { .etag = response.etag, .version_id = response.version_id };
}

std::string
logship::S3Connection::get_object(std::string_view bucket_name,
                                  std::string_view object_name)
{
    EXPECT(!bucket_name.empty(), "Bucket name must not be empty.");
    EXPECT(!object_name.empty(), "Object name must not be empty.");

    std::string contents;

    minio::s3::GetObjectArgs args;
    args.bucket = bucket_name;
    args.object = object_name;
    args.datafunc = [&contents](minio::http::DataFunctionArgs args) -> bool {
        contents += args.datachunk;
        return true;
    };

    auto response = client_->GetObject(args);
    EXPECT(response,
           "Failed to get object ",
           object_name,
           " from bucket ",
           bucket_name,
           ": ",
           response.Error().String());

    return contents;
}

bool
logship::S3Connection::delete_object(std::string_view bucket_name,
                                     std::string_view object_name)
{
    EXPECT(!bucket_name.empty(), "Bucket name must not be empty.");
    EXPECT(!object_name.empty(), "Object name must not be empty.");

    LOG_DEBUG("Deleting object ", object_name, " from bucket ", bucket_name);
    minio::s3::RemoveObjectArgs args;
    args.bucket = bucket_name;
    args.object = object_name;

    auto response = client_->RemoveObject(args);
    if (!response) {
        LOG_ERROR("Failed to delete object ",
                  object_name,
                  " from bucket ",
                  bucket_name,
                  ": ",
                  response.Error().String());
        return false;
    }

    return true;
}

logship::S3ConnectionPool::S3ConnectionPool(size_t n_connections,
                                            const S3Settings& settings)
{
    EXPECT(n_connections > 0, "Connection pool must not be empty.");

    for (auto i = 0u; i < n_connections; ++i) {
        connections_.push_back(std::make_unique<S3Connection>(settings));
    }

    // write-only credentials can't list buckets, and puts may still succeed
    if (!connections_.front()->is_connection_valid()) {
        LOG_WARNING("Failed to list buckets at ",
                    settings.endpoint.empty() ? std::string(default_endpoint)
                                              : settings.endpoint,
                    ". Uploads may fail.");
    }
}

logship::S3ConnectionPool::~S3ConnectionPool() noexcept
{
    {
        std::scoped_lock lock(connections_mutex_);
        is_accepting_connections_ = false;
    }
    cv_.notify_all();
}

std::unique_ptr<logship::S3Connection>
logship::S3ConnectionPool::get_connection()
{
    std::unique_lock lock(connections_mutex_);
    cv_.wait(lock, [this] {
        return !is_accepting_connections_ || !connections_.empty();
    });

    if (!is_accepting_connections_ || connections_.empty()) {
        return nullptr;
    }

    auto conn = std::move(connections_.back());
    connections_.pop_back();
    return conn;
}

void
logship::S3ConnectionPool::return_connection(
  std::unique_ptr<S3Connection>&& conn)
{
    std::unique_lock lock(connections_mutex_);
    connections_.push_back(std::move(conn));
    cv_.notify_one();
}
