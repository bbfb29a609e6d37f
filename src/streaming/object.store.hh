#pragma once

#include "metadata.builder.hh"

#include <cstddef> // std::byte
#include <string>
#include <vector>

namespace logship {
struct PutObjectRequest
{
    std::string bucket_name;
    std::string object_key;
    std::vector<std::byte> body;
    ObjectMetadata metadata;
};

struct PutObjectResult
{
    std::string etag;
    std::string version_id;
};

/**
 * @brief Destination of uploaded log objects.
 * @details A put replaces the whole object. Implementations treat it as
 * all-or-nothing.
 */
class ObjectStore
{
  public:
    virtual ~ObjectStore() = default;

    /**
     * @brief Put an object, replacing any object with the same key.
     * @param request The bucket, key, body and metadata of the object.
     * @returns The result reported by the store.
     * @throws std::runtime_error if the object could not be stored.
     */
    [[nodiscard]] virtual PutObjectResult put_object(
      const PutObjectRequest& request) = 0;
};
} // namespace logship
