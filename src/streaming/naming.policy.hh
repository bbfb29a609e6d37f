#pragma once

#include <chrono>
#include <string>
#include <string_view>

namespace logship {
/**
 * @brief Ensure a nonempty folder ends in exactly one '/'.
 * @param folder The key prefix.
 * @return The empty string if @p folder is empty, otherwise @p folder with
 * its trailing slashes collapsed to one.
 */
std::string
normalize_folder(std::string_view folder);

/**
 * @brief Build the key of an object created at @p created_at.
 * @param folder The key prefix.
 * @param created_at The time the object was created.
 * @param name_format strftime pattern, rendered in UTC.
 * @return The object key.
 * @throws std::runtime_error if @p name_format renders to an empty string.
 */
std::string
make_object_key(std::string_view folder,
                std::chrono::system_clock::time_point created_at,
                std::string_view name_format);

/**
 * @brief The name pattern used when none is configured, e.g.
 * "%Y-%b-%d-%H-%M-production-myhost.log.gz".
 */
std::string
default_name_format(std::string_view environment,
                    std::string_view hostname,
                    bool save_logs_in_json,
                    bool compress);

/// @brief $LOGSHIP_ENVIRONMENT, or "development" if unset.
std::string
default_environment();

/// @brief The name of this machine, or "localhost" if it can't be determined.
std::string
host_name();
} // namespace logship
