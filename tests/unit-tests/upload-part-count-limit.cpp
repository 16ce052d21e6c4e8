#include "partsink/address.source.hh"
#include "partsink/lines.encoder.hh"
#include "partsink/memory.upload.client.hh"
#include "partsink/upload.forever.hh"
#include "partsink/upload.hh"
#include "unit.test.macros.hh"

#include <memory>
#include <string>
#include <vector>

using partsink::RemoteOperation;

namespace {
const size_t part_size = 5 << 20;

// one line of exactly part_size bytes, newline included
const std::string line(part_size - 1, 'p');

void
check_finite_upload_completes_at_part_limit()
{
    auto client = std::make_shared<partsink::MemoryUploadClient>();
    const partsink::ObjectAddress address("bucket", "limited.txt");

    partsink::UploadSettings settings;
    settings.max_part_count = 3;

    partsink::Upload<partsink::LinesEncoder> upload(
      client, address, partsink::LinesEncoder{}, settings);

    upload.push(line);
    upload.push(line);
    EXPECT_EQ(unsigned int, upload.progress()->parts_committed, 2);

    // two parts committed leaves only the final part number, so the object
    // is completed before more bytes are buffered
    EXPECT_THROW(partsink::ProtocolViolation, upload.push(line));
    CHECK(upload.phase() == PartsinkSessionPhase_Completed);

    EXPECT_EQ(size_t, client->count(RemoteOperation::UploadPart), 2);
    EXPECT_EQ(size_t, client->count(RemoteOperation::CompleteUpload), 1);
    EXPECT_EQ(size_t, client->count(RemoteOperation::AbortUpload), 0);
    EXPECT_EQ(size_t, client->object(address)->size(), 2 * part_size);

    // flushing the completed object is a no-op
    const auto n_calls = client->calls().size();
    const auto& completed = upload.flush();
    EXPECT_EQ(unsigned int, completed.n_parts, 2);
    EXPECT_EQ(size_t, completed.size, 2 * part_size);
    EXPECT_EQ(size_t, client->calls().size(), n_calls);
}

void
check_forever_upload_rotates_at_part_limit()
{
    auto client = std::make_shared<partsink::MemoryUploadClient>();

    std::vector<partsink::ObjectAddress> addresses;
    for (auto i = 0; i < 3; ++i) {
        addresses.emplace_back("bucket", "limited/" + std::to_string(i));
    }

    partsink::UploadSettings settings;
    settings.target_size = 100 * part_size; // never reached
    settings.max_part_count = 3;

    partsink::UploadForever<partsink::LinesEncoder> upload(
      client, std::make_unique<partsink::AddressList>(addresses), settings);

    for (auto i = 0; i < 5; ++i) {
        upload.push(line);
    }
    upload.close();

    const auto& completed = upload.completed_uploads();
    EXPECT_EQ(size_t, completed.size(), 3);

    const std::vector<unsigned int> expected_parts{ 2, 2, 1 };
    for (size_t i = 0; i < completed.size(); ++i) {
        CHECK(completed[i].address == addresses[i]);
        EXPECT_EQ(unsigned int, completed[i].n_parts, expected_parts[i]);
        EXPECT_EQ(size_t, completed[i].size, expected_parts[i] * part_size);
        CHECK(completed[i].n_parts < settings.max_part_count);
    }

    // no part number above the limit was ever used
    for (const auto& call : client->calls()) {
        if (call.operation == RemoteOperation::UploadPart) {
            CHECK(call.part_number < settings.max_part_count);
        }
    }
    EXPECT_EQ(size_t, client->count(RemoteOperation::AbortUpload), 0);
    EXPECT_EQ(size_t, client->n_active_uploads(), 0);
}
} // namespace

int
main()
{
    int retval = 1;

    try {
        check_finite_upload_completes_at_part_limit();
        check_forever_upload_rotates_at_part_limit();

        retval = 0;
    } catch (const std::exception& exc) {
        LOG_ERROR("Caught exception: ", exc.what());
    }

    return retval;
}
