#include "partsink/lines.encoder.hh"
#include "partsink/memory.upload.client.hh"
#include "partsink/upload.hh"
#include "partsink/upload.session.hh"
#include "unit.test.macros.hh"

#include <chrono>
#include <string>
#include <thread>

using partsink::RemoteOperation;

namespace {
void
check_dropped_upload_is_aborted()
{
    auto client = std::make_shared<partsink::MemoryUploadClient>();

    {
        partsink::Upload<partsink::LinesEncoder> upload(
          client, { "bucket", "dropped.txt" });

        const std::string line((1 << 20) - 1, 'd');
        for (auto i = 0; i < 7; ++i) {
            upload.push(line);
        }
        EXPECT_EQ(size_t, client->count(RemoteOperation::UploadPart), 1);
        EXPECT_EQ(size_t, client->n_active_uploads(), 1);
    }

    EXPECT_EQ(size_t, client->count(RemoteOperation::AbortUpload), 1);
    EXPECT_EQ(size_t, client->count(RemoteOperation::CompleteUpload), 0);
    EXPECT_EQ(size_t, client->n_active_uploads(), 0);
    EXPECT_EQ(size_t, client->n_objects(), 0);
}

void
check_unopened_upload_is_not_aborted()
{
    auto client = std::make_shared<partsink::MemoryUploadClient>();

    {
        partsink::Upload<partsink::LinesEncoder> upload(
          client, { "bucket", "unused.txt" });
    }

    CHECK(client->calls().empty());
}

void
check_completed_upload_is_not_aborted()
{
    auto client = std::make_shared<partsink::MemoryUploadClient>();

    {
        partsink::Upload<partsink::LinesEncoder> upload(
          client, { "bucket", "kept.txt" });
        upload.push("kept");
        (void)upload.close();
    }

    EXPECT_EQ(size_t, client->count(RemoteOperation::AbortUpload), 0);
    CHECK(client->object({ "bucket", "kept.txt" }).has_value());
}

void
check_explicit_abort_waits_for_part_in_flight()
{
    auto client = std::make_shared<partsink::MemoryUploadClient>();

    partsink::UploadSession session(client, { "bucket", "explicit" }, {});
    session.open();
    CHECK(session.poll());

    std::vector<std::byte> data(5 << 20, std::byte{ 'e' });
    CHECK(session.buffer().append(data) ==
          partsink::PartBuffer::AppendResult::Accepted);
    session.cut_part();

    session.abort();
    CHECK(session.phase() == PartsinkSessionPhase_Aborted);
    CHECK(!session.has_pending());
    EXPECT_EQ(size_t, client->count(RemoteOperation::AbortUpload), 1);
    EXPECT_EQ(size_t, client->n_active_uploads(), 0);
}

void
check_teardown_waits_for_held_part()
{
    auto client = std::make_shared<partsink::MemoryUploadClient>();

    std::thread releaser;
    {
        partsink::Upload<partsink::LinesEncoder> upload(
          client, { "bucket", "held.txt" });

        const std::string line((1 << 20) - 1, 'h');
        for (auto i = 0; i < 4; ++i) {
            upload.push(line);
        }

        // the part upload is held when the upload goes out of scope
        client->set_deferred(true);
        upload.push(line);
        EXPECT_EQ(size_t, client->count(RemoteOperation::UploadPart), 1);
        CHECK(!upload.poll_ready());
        CHECK(upload.phase() == PartsinkSessionPhase_Open);

        releaser = std::thread([client] {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            client->set_deferred(false);
        });
    }
    releaser.join();

    EXPECT_EQ(size_t, client->count(RemoteOperation::UploadPart), 1);
    EXPECT_EQ(size_t, client->count(RemoteOperation::AbortUpload), 1);
    EXPECT_EQ(size_t, client->n_active_uploads(), 0);
}
} // namespace

int
main()
{
    int retval = 1;

    try {
        check_dropped_upload_is_aborted();
        check_unopened_upload_is_not_aborted();
        check_completed_upload_is_not_aborted();
        check_explicit_abort_waits_for_part_in_flight();
        check_teardown_waits_for_held_part();

        retval = 0;
    } catch (const std::exception& exc) {
        LOG_ERROR("Caught exception: ", exc.what());
    }

    return retval;
}
