#include "partsink/memory.upload.client.hh"
#include "partsink/upload.sink.hh"
#include "unit.test.macros.hh"

#include <string>
#include <vector>

using partsink::RemoteOperation;

namespace {
const size_t min_part_size = 5 << 20;
const size_t max_part_size = 7 << 20;

std::vector<std::byte>
make_record(size_t size, size_t seed)
{
    std::vector<std::byte> record(size);
    for (size_t i = 0; i < size; ++i) {
        record[i] = static_cast<std::byte>('a' + (seed + i) % 26);
    }
    return record;
}

size_t
ceil_div(size_t a, size_t b)
{
    return (a + b - 1) / b;
}
} // namespace

int
main()
{
    int retval = 1;

    try {
        auto client = std::make_shared<partsink::MemoryUploadClient>();
        const partsink::ObjectAddress address("bucket", "bounds.bin");

        partsink::UploadSettings settings;
        settings.min_part_size = min_part_size;
        settings.max_part_size = max_part_size;

        partsink::UploadSink sink(client, address, settings);

        // small records, odd sizes, and records larger than a whole part
        const std::vector<size_t> sizes{ 700 << 10,  1,         3 << 20,
                                         20 << 20,   123457,    (5 << 20) - 1,
                                         9 << 20,    2,         4 << 20,
                                         max_part_size };

        std::string expected;
        size_t total = 0;
        for (size_t i = 0; i < sizes.size(); ++i) {
            const auto record = make_record(sizes[i], i);
            sink.push(record);

            expected.append(reinterpret_cast<const char*>(record.data()),
                            record.size());
            total += record.size();
        }

        const auto& completed = sink.flush();
        EXPECT_EQ(size_t, completed.size, total);

        std::vector<size_t> part_sizes;
        for (const auto& call : client->calls()) {
            if (call.operation == RemoteOperation::UploadPart) {
                EXPECT_EQ(unsigned int, call.part_number, part_sizes.size() + 1);
                part_sizes.push_back(call.size);
            }
        }

        const auto n_parts = part_sizes.size();
        EXPECT_EQ(size_t, completed.n_parts, n_parts);
        CHECK(ceil_div(total, max_part_size) <= n_parts);
        CHECK(n_parts <= ceil_div(total, min_part_size));

        for (size_t i = 0; i + 1 < n_parts; ++i) {
            CHECK(part_sizes[i] >= min_part_size);
            CHECK(part_sizes[i] <= max_part_size);
        }
        CHECK(part_sizes.back() <= max_part_size);

        const auto object = client->object(address);
        CHECK(object.has_value());
        CHECK(*object == expected);

        retval = 0;
    } catch (const std::exception& exc) {
        LOG_ERROR("Caught exception: ", exc.what());
    }

    return retval;
}
