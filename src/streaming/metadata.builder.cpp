#include "metadata.builder.hh"

namespace {
std::optional<std::string>
optional_string(const std::string& value)
{
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}
} // namespace

std::optional<std::string>
logship::make_tagging(const std::map<std::string, std::string>& tags)
{
    if (tags.empty()) {
        return std::nullopt;
    }

    std::string tagging;
    for (const auto& [key, value] : tags) {
        if (!tagging.empty()) {
            tagging += "&";
        }
        tagging += key + "=" + value;
    }

    return tagging;
}

logship::ObjectMetadata
logship::make_object_metadata(const StreamConfig& config)
{
    ObjectMetadata metadata;
    metadata.tagging = make_tagging(config.tags);
    metadata.storage_class = optional_string(config.storage_class);
    metadata.server_side_encryption =
      optional_string(config.server_side_encryption);
    metadata.acl = optional_string(config.acl);

    // plain text objects can be previewed in a browser
    if (!config.compress) {
        metadata.content_type = "text/plain";
    }

    return metadata;
}
