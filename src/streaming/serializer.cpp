#include "serializer.hh"
#include "macros.hh"

#include <zlib.h>

#include <algorithm>
#include <cstring>

namespace {
std::string
as_text(std::span<const std::byte> chunk)
{
    return { reinterpret_cast<const char*>(chunk.data()), chunk.size() };
}

constexpr size_t gzip_buffer_size = 1 << 16;
} // namespace

logship::LogEntry
logship::parse_entry(std::span<const std::byte> chunk)
{
    const auto* begin = reinterpret_cast<const char*>(chunk.data());
    auto value = nlohmann::ordered_json::parse(begin,
                                       begin + chunk.size(),
                                       nullptr, // callback
                                       false    // allow exceptions
    );

    if (value.is_discarded()) {
        return as_text(chunk);
    }

    return value;
}

std::string
logship::make_json_array(const std::vector<Chunk>& chunks)
{
    auto array = nlohmann::ordered_json::array();
    for (const auto& chunk : chunks) {
        std::visit([&array](auto&& entry) { array.emplace_back(std::move(entry)); },
                   parse_entry(chunk));
    }

    return array.dump(
      -1, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
}

std::vector<std::byte>
logship::gzip_compress(std::span<const std::byte> data, int level)
{
    z_stream zs;
    std::memset(&zs, 0, sizeof(zs));

    // 16 + MAX_WBITS selects the gzip wrapper
    int ret = deflateInit2(&zs,
                           std::clamp(level, Z_NO_COMPRESSION, Z_BEST_COMPRESSION),
                           Z_DEFLATED,
                           16 + MAX_WBITS,
                           8,
                           Z_DEFAULT_STRATEGY);
    EXPECT(ret == Z_OK, "Failed to initialize gzip stream: ", ret);

    std::vector<std::byte> compressed;
    compressed.reserve(deflateBound(&zs, static_cast<uLong>(data.size())));

    zs.next_in =
      reinterpret_cast<Bytef*>(const_cast<std::byte*>(data.data()));
    zs.avail_in = static_cast<uInt>(data.size());

    std::vector<Bytef> buffer(gzip_buffer_size);
    do {
        zs.next_out = buffer.data();
        zs.avail_out = static_cast<uInt>(buffer.size());

        ret = deflate(&zs, Z_FINISH);
        if (ret == Z_STREAM_ERROR || ret == Z_BUF_ERROR) {
            deflateEnd(&zs);
            const std::string err =
              LOG_ERROR("Error during gzip compression: ", ret);
            throw std::runtime_error(err);
        }

        const auto nbytes = buffer.size() - zs.avail_out;
        const auto* out = reinterpret_cast<const std::byte*>(buffer.data());
        compressed.insert(compressed.end(), out, out + nbytes);
    } while (ret != Z_STREAM_END);

    deflateEnd(&zs);

    return compressed;
}

std::vector<std::byte>
logship::prepare_payload(const std::vector<Chunk>& chunks,
                         const StreamConfig& config)
{
    std::vector<std::byte> payload;

    if (config.save_logs_in_json) {
        const std::string json = make_json_array(chunks);
        const auto* begin = reinterpret_cast<const std::byte*>(json.data());
        payload.assign(begin, begin + json.size());
    } else {
        size_t nbytes = 0;
        for (const auto& chunk : chunks) {
            nbytes += chunk.size();
        }

        payload.reserve(nbytes);
        for (const auto& chunk : chunks) {
            payload.insert(payload.end(), chunk.begin(), chunk.end());
        }
    }

    if (config.compress) {
        return gzip_compress(payload);
    }

    return payload;
}
