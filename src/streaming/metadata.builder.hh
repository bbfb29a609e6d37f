#pragma once

#include "stream.config.hh"

#include <map>
#include <optional>
#include <string>

namespace logship {
/// @brief Per-object metadata sent with every put. Unset fields are omitted.
struct ObjectMetadata
{
    std::optional<std::string> tagging;
    std::optional<std::string> storage_class;
    std::optional<std::string> server_side_encryption;
    std::optional<std::string> acl;
    std::optional<std::string> content_type;
};

/**
 * @brief Build the tagging string "k1=v1&k2=v2" for @p tags.
 * @return The tagging string, or std::nullopt if @p tags is empty.
 */
std::optional<std::string>
make_tagging(const std::map<std::string, std::string>& tags);

ObjectMetadata
make_object_metadata(const StreamConfig& config);
} // namespace logship
