#include "partsink/part.buffer.hh"
#include "unit.test.macros.hh"

#include <vector>

namespace {
const size_t min_part_size = 5 << 20;
const size_t max_part_size = 6 << 20;

void
check_append_is_all_or_nothing()
{
    partsink::PartBuffer buffer(min_part_size, max_part_size);
    CHECK(buffer.empty());
    CHECK(!buffer.is_cut_ready());

    std::vector<std::byte> record(4 << 20, std::byte{ 'a' });
    CHECK(buffer.append(record) == partsink::PartBuffer::AppendResult::Accepted);
    EXPECT_EQ(size_t, buffer.size(), 4 << 20);
    CHECK(!buffer.is_cut_ready());

    // 8 MiB would exceed the maximum part size, so nothing is appended
    CHECK(buffer.append(record) ==
          partsink::PartBuffer::AppendResult::WouldExceedMax);
    EXPECT_EQ(size_t, buffer.size(), 4 << 20);
    EXPECT_EQ(size_t, buffer.space_remaining(), 2 << 20);

    std::vector<std::byte> small(1 << 20, std::byte{ 'b' });
    CHECK(buffer.append(small) == partsink::PartBuffer::AppendResult::Accepted);
    CHECK(buffer.is_cut_ready());
    CHECK(!buffer.is_full());
}

void
check_fill_stops_at_max()
{
    partsink::PartBuffer buffer(min_part_size, max_part_size);

    std::vector<std::byte> record(10 << 20, std::byte{ 'c' });
    EXPECT_EQ(size_t, buffer.fill(record), max_part_size);
    CHECK(buffer.is_full());
    EXPECT_EQ(size_t, buffer.space_remaining(), 0);
    EXPECT_EQ(size_t, buffer.fill(record), 0);
}

void
check_take_resets_and_recycles()
{
    partsink::PartBuffer buffer(min_part_size, max_part_size);

    std::vector<std::byte> record(min_part_size, std::byte{ 'd' });
    CHECK(buffer.append(record) == partsink::PartBuffer::AppendResult::Accepted);

    auto part = buffer.take();
    EXPECT_EQ(size_t, part.size(), min_part_size);
    CHECK(part.front() == std::byte{ 'd' });
    CHECK(buffer.empty());
    EXPECT_EQ(size_t, buffer.space_remaining(), max_part_size);

    buffer.recycle(std::move(part));

    // taking an empty buffer yields an empty part
    auto empty = buffer.take();
    CHECK(empty.empty());

    CHECK(buffer.append(record) == partsink::PartBuffer::AppendResult::Accepted);
    auto second = buffer.take();
    EXPECT_EQ(size_t, second.size(), min_part_size);
    CHECK(second.back() == std::byte{ 'd' });
}
} // namespace

int
main()
{
    int retval = 1;

    try {
        check_append_is_all_or_nothing();
        check_fill_stops_at_max();
        check_take_resets_and_recycles();

        EXPECT_THROW(std::runtime_error,
                     (void)partsink::PartBuffer(max_part_size, min_part_size));

        retval = 0;
    } catch (const std::exception& exc) {
        LOG_ERROR("Caught exception: ", exc.what());
    }

    return retval;
}
