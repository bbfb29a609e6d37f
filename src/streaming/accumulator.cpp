#include "accumulator.hh"
#include "macros.hh"

void
logship::Accumulator::append(std::span<const std::byte> data)
{
    if (data.empty()) {
        return;
    }

    chunks_.emplace_back(data.begin(), data.end());
    total_bytes_ += data.size();
    unwritten_bytes_ += data.size();
}

size_t
logship::Accumulator::total_bytes() const
{
    return total_bytes_;
}

size_t
logship::Accumulator::chunk_count() const
{
    return chunks_.size();
}

size_t
logship::Accumulator::unwritten_bytes() const
{
    return unwritten_bytes_;
}

size_t
logship::Accumulator::take_unwritten()
{
    const size_t unwritten = unwritten_bytes_;
    unwritten_bytes_ = 0;
    return unwritten;
}

void
logship::Accumulator::restore_unwritten(size_t nbytes)
{
    unwritten_bytes_ += nbytes;
}

std::vector<logship::Chunk>
logship::Accumulator::chunks() const
{
    return chunks_;
}

void
logship::Accumulator::drop_front(size_t n)
{
    EXPECT(n <= chunks_.size(),
           "Cannot drop ",
           n,
           " chunks, only ",
           chunks_.size(),
           " buffered.");

    for (auto i = 0u; i < n; ++i) {
        total_bytes_ -= chunks_[i].size();
    }
    chunks_.erase(chunks_.begin(), chunks_.begin() + n);
}
