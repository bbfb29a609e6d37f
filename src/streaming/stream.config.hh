#pragma once

#include <chrono>
#include <cstddef> // size_t
#include <map>
#include <string>

namespace logship {
struct S3Settings
{
    std::string endpoint;
    std::string bucket_name;
    std::string access_key_id;
    std::string secret_access_key;
    std::string region;
};

/**
 * @brief Immutable configuration of a log stream, with all defaults
 * resolved.
 */
struct StreamConfig
{
    S3Settings s3;

    std::string folder;
    std::string name_format; /* strftime pattern, never empty once committed */
    std::string environment;

    std::chrono::milliseconds upload_delay{ 20 * 1000 };
    size_t buffer_size{ 10 * 1000 };
    std::chrono::milliseconds rotate_every{ 60 * 60 * 1000 };
    size_t max_file_size{ 200 * 1000 };

    bool compress{ false };
    bool save_logs_in_json{ false };

    std::map<std::string, std::string> tags;
    std::string storage_class;
    std::string server_side_encryption;
    std::string acl;
};
} // namespace logship
