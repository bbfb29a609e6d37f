#pragma once

#include <cstddef> // size_t, std::byte
#include <span>
#include <vector>

namespace logship {
using Chunk = std::vector<std::byte>;

/**
 * @brief Ordered buffer of the chunks written in the current epoch.
 * @details Tracks two quantities: the bytes held in the chunk sequence,
 * which is what the next object will contain, and the bytes not yet
 * confirmed uploaded, which drives the flush policy. Not thread safe; the
 * owner serializes access.
 */
class Accumulator
{
  public:
    /// @brief Append a copy of @p data. Empty writes are ignored.
    void append(std::span<const std::byte> data);

    /// @brief Sum of the lengths of the buffered chunks.
    [[nodiscard]] size_t total_bytes() const;

    [[nodiscard]] size_t chunk_count() const;

    [[nodiscard]] size_t unwritten_bytes() const;

    /**
     * @brief Reset the unwritten byte count to zero.
     * @return The count before the reset.
     */
    size_t take_unwritten();

    /// @brief Add @p nbytes back to the unwritten byte count.
    void restore_unwritten(size_t nbytes);

    /// @brief Copy of the buffered chunks, in write order.
    [[nodiscard]] std::vector<Chunk> chunks() const;

    /**
     * @brief Remove the first @p n chunks.
     * @throws std::runtime_error if fewer than @p n chunks are buffered.
     */
    void drop_front(size_t n);

  private:
    std::vector<Chunk> chunks_;
    size_t total_bytes_{ 0 };
    size_t unwritten_bytes_{ 0 };
};
} // namespace logship
