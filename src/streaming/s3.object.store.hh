#pragma once

#include "object.store.hh"
#include "s3.connection.hh"

#include <memory>

namespace logship {
class S3ObjectStore : public ObjectStore
{
  public:
    /**
     * @details The bucket is checked once, but only a warning is logged if
     * the check fails. Puts report their own failures.
     * @throws std::runtime_error if the bucket name is empty or the pool is
     * null.
     */
    S3ObjectStore(std::string_view bucket_name,
                  std::shared_ptr<S3ConnectionPool> connection_pool);

    [[nodiscard]] PutObjectResult put_object(
      const PutObjectRequest& request) override;

  private:
    std::shared_ptr<S3ConnectionPool> connection_pool_;
};
} // namespace logship
