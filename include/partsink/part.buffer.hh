#pragma once

#include <cstddef>
#include <span>
#include <vector>

namespace partsink {
/**
 * @brief Accumulates the bytes of the part being assembled.
 *
 * The buffer never holds more than the maximum part size. It becomes ready to
 * cut once it holds at least the minimum part size.
 */
class PartBuffer
{
  public:
    enum class AppendResult
    {
        Accepted,
        WouldExceedMax,
    };

    PartBuffer(size_t min_part_size, size_t max_part_size);

    /**
     * @brief Append all of @p data, or nothing.
     * @return WouldExceedMax, with the buffer unchanged, if @p data does not
     * fit under the maximum part size.
     */
    [[nodiscard]] AppendResult append(std::span<const std::byte> data);

    /**
     * @brief Append as much of @p data as fits under the maximum part size.
     * @return The number of bytes appended.
     */
    size_t fill(std::span<const std::byte> data);

    [[nodiscard]] bool is_cut_ready() const noexcept;
    bool is_full() const noexcept;
    bool empty() const noexcept;

    /** @brief Bytes written since the last cut. */
    size_t size() const noexcept;
    size_t space_remaining() const noexcept;

    size_t min_part_size() const noexcept { return min_part_size_; }
    size_t max_part_size() const noexcept { return max_part_size_; }

    /**
     * @brief Take the buffered bytes as a part payload and reset the buffer.
     */
    [[nodiscard]] std::vector<std::byte> take();

    /**
     * @brief Hand back the storage of a payload returned by take() once it has
     * been uploaded, so that the next part reuses its allocation.
     */
    void recycle(std::vector<std::byte>&& storage) noexcept;

  private:
    size_t min_part_size_;
    size_t max_part_size_;

    std::vector<std::byte> data_;
    std::vector<std::byte> spare_;
};
} // namespace partsink
