#pragma once

#include "accumulator.hh"
#include "stream.config.hh"

#include <nlohmann/json.hpp>

#include <span>
#include <string>
#include <variant>
#include <vector>

namespace logship {
/// @brief A buffered write, either parsed as JSON (fields kept in their
/// written order) or kept as raw text.
using LogEntry = std::variant<nlohmann::ordered_json, std::string>;

/**
 * @brief Parse @p chunk as a JSON value.
 * @return The parsed value, or the chunk's text if it is not valid JSON.
 */
LogEntry
parse_entry(std::span<const std::byte> chunk);

/**
 * @brief Package @p chunks as a compact JSON array, one element per chunk.
 * @details Malformed entries are kept as strings. Invalid UTF-8 is replaced
 * with U+FFFD.
 */
std::string
make_json_array(const std::vector<Chunk>& chunks);

/**
 * @brief Compress @p data in gzip format.
 * @throws std::runtime_error if zlib fails.
 */
std::vector<std::byte>
gzip_compress(std::span<const std::byte> data, int level = 6);

/**
 * @brief Convert the buffered chunks into the body of one object.
 * @details Chunks are concatenated in order, or packaged as a JSON array if
 * @p config.save_logs_in_json is set. The result is gzip-compressed if
 * @p config.compress is set.
 * @throws std::runtime_error if compression fails.
 */
std::vector<std::byte>
prepare_payload(const std::vector<Chunk>& chunks, const StreamConfig& config);
} // namespace logship
