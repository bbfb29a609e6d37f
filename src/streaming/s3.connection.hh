#pragma once

#include "object.store.hh"
#include "stream.config.hh"

#include <miniocpp/client.h>

#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace logship {
class S3Connection
{
  public:
    explicit S3Connection(const S3Settings& settings);

    ~S3Connection() noexcept = default;

    /**
     * @brief Test a connection by listing all buckets at this connection's
     * endpoint.
     * @returns True if the connection is valid, otherwise false.
     */
    bool is_connection_valid();

    /* Bucket operations */

    /**
     * @brief Check whether a bucket exists.
     * @param bucket_name The name of the bucket.
     * @returns True if the bucket exists, otherwise false.
     */
    bool bucket_exists(std::string_view bucket_name);

    /* Object operations */

    /**
     * @brief Check whether an object exists.
     * @param bucket_name The name of the bucket containing the object.
     * @param object_name The name of the object.
     * @returns True if the object exists, otherwise false.
     */
    bool object_exists(std::string_view bucket_name,
                       std::string_view object_name);

    /**
     * @brief Put an object, along with its tagging, storage class,
     * server-side encryption, ACL and content type.
     * @param request The object to put.
     * @returns The etag and version ID of the object.
     * @throws std::runtime_error if the bucket name is empty, the object name
     * is empty, or the put fails.
     */
    [[nodiscard]] PutObjectResult put_object(const PutObjectRequest& request);

    /**
     * @brief Read an object.
     * @param bucket_name The name of the bucket containing the object.
     * @param object_name The name of the object.
     * @returns The contents of the object.
     * @throws std::runtime_error if the object cannot be read.
     */
    [[nodiscard]] std::string get_object(std::string_view bucket_name,
                                         std::string_view object_name);

    /**
     * @brief Delete an object.
     * @param bucket_name The name of the bucket containing the object.
     * @param object_name The name of the object.
     * @returns True if the object was successfully deleted, otherwise false.
     */
    [[nodiscard]] bool delete_object(std::string_view bucket_name,
                                     std::string_view object_name);

  private:
    std::unique_ptr<minio::s3::Client> client_;
    std::unique_ptr<minio::creds::StaticProvider> provider_;
};

class S3ConnectionPool
{
  public:
    S3ConnectionPool(size_t n_connections, const S3Settings& settings);
    ~S3ConnectionPool() noexcept;

    std::unique_ptr<S3Connection> get_connection();
    void return_connection(std::unique_ptr<S3Connection>&& conn);

  private:
    std::vector<std::unique_ptr<S3Connection>> connections_;
    mutable std::mutex connections_mutex_;
    std::condition_variable cv_;

    bool is_accepting_connections_{ true };
};
} // namespace logship
