#include "partsink/lines.encoder.hh"
#include "partsink/memory.upload.client.hh"
#include "partsink/upload.hh"
#include "unit.test.macros.hh"

int
main()
{
    int retval = 1;

    try {
        auto client = std::make_shared<partsink::MemoryUploadClient>();
        partsink::Upload<partsink::LinesEncoder> upload(
          client, { "bucket", "closed.txt" });

        upload.push("only line");
        const auto& completed = upload.close();
        EXPECT_EQ(unsigned int, completed.n_parts, 1);

        const auto n_calls = client->calls().size();
        EXPECT_THROW(partsink::ProtocolViolation, upload.push("too late"));
        EXPECT_THROW(partsink::ProtocolViolation,
                     upload.start_new_upload({ "bucket", "reopened.txt" }));
        EXPECT_EQ(size_t, client->calls().size(), n_calls);

        // closing again is harmless
        CHECK(upload.poll_close());
        EXPECT_EQ(size_t, client->calls().size(), n_calls);

        retval = 0;
    } catch (const std::exception& exc) {
        LOG_ERROR("Caught exception: ", exc.what());
    }

    return retval;
}
