#include "macros.hh"
#include "s3.object.store.hh"

logship::S3ObjectStore::S3ObjectStore(
  std::string_view bucket_name,
  std::shared_ptr<S3ConnectionPool> connection_pool)
  : connection_pool_{ connection_pool }
{
    EXPECT(!bucket_name.empty(), "Bucket name must not be empty.");
    EXPECT(connection_pool_, "Null pointer: connection_pool");

    auto connection = connection_pool_->get_connection();
    EXPECT(connection, "No S3 connection available.");

    // a failed check is not fatal: the bucket policy may allow puts only
    const bool exists = connection->bucket_exists(bucket_name);
    connection_pool_->return_connection(std::move(connection));

    if (!exists) {
        LOG_WARNING("Could not confirm that bucket '",
                    bucket_name,
                    "' exists. Uploads may fail.");
    }
}

logship::PutObjectResult
logship::S3ObjectStore::put_object(const PutObjectRequest& request)
{
    auto connection = connection_pool_->get_connection();
    EXPECT(connection, "No S3 connection available.");

    PutObjectResult result;
    try {
        result = connection->put_object(request);
    } catch (const std::exception&) {
        // cleanup
        connection_pool_->return_connection(std::move(connection));
        throw;
    }

    connection_pool_->return_connection(std::move(connection));

    return result;
}
