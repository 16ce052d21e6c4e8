#include "macros.hh"
#include "partsink/part.buffer.hh"

#include <algorithm>

partsink::PartBuffer::PartBuffer(size_t min_part_size, size_t max_part_size)
  : min_part_size_{ min_part_size }
  , max_part_size_{ max_part_size }
{
    EXPECT(min_part_size_ > 0, "Minimum part size must be positive");
    EXPECT(min_part_size_ <= max_part_size_,
           "Minimum part size ",
           min_part_size_,
           " exceeds maximum part size ",
           max_part_size_);

    data_.reserve(min_part_size_);
}

partsink::PartBuffer::AppendResult
partsink::PartBuffer::append(std::span<const std::byte> data)
{
    if (data.size() > space_remaining()) {
        return AppendResult::WouldExceedMax;
    }

    data_.insert(data_.end(), data.begin(), data.end());
    return AppendResult::Accepted;
}

size_t
partsink::PartBuffer::fill(std::span<const std::byte> data)
{
    const auto n = std::min(data.size(), space_remaining());
    data_.insert(data_.end(), data.begin(), data.begin() + n);

    return n;
}

bool
partsink::PartBuffer::is_cut_ready() const noexcept
{
    return data_.size() >= min_part_size_;
}

bool
partsink::PartBuffer::is_full() const noexcept
{
    return data_.size() == max_part_size_;
}

bool
partsink::PartBuffer::empty() const noexcept
{
    return data_.empty();
}

size_t
partsink::PartBuffer::size() const noexcept
{
    return data_.size();
}

size_t
partsink::PartBuffer::space_remaining() const noexcept
{
    return max_part_size_ - data_.size();
}

std::vector<std::byte>
partsink::PartBuffer::take()
{
    std::vector<std::byte> part;
    part.swap(data_);
    data_.swap(spare_);
    data_.clear();

    return part;
}

void
partsink::PartBuffer::recycle(std::vector<std::byte>&& storage) noexcept
{
    storage.clear();
    if (storage.capacity() > spare_.capacity()) {
        spare_.swap(storage);
    }
}
