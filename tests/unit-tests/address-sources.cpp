#include "partsink/address.source.hh"
#include "partsink/errors.hh"
#include "unit.test.macros.hh"

#include <chrono>

namespace {
void
check_address_list()
{
    partsink::AddressList list({ { "bucket", "a" }, { "bucket", "b" } });
    EXPECT_EQ(size_t, list.remaining(), 2);

    auto first = list.next();
    CHECK(first.has_value());
    EXPECT_STR_EQ(first->key, "a");

    auto second = list.next();
    CHECK(second.has_value());
    EXPECT_STR_EQ(second->key, "b");

    CHECK(!list.next().has_value());
    CHECK(!list.next().has_value());
    EXPECT_EQ(size_t, list.remaining(), 0);

    EXPECT_THROW(partsink::ProtocolViolation,
                 (void)partsink::AddressList(
                   std::vector<partsink::ObjectAddress>{ { "bucket", "" } }));
}

void
check_timestamped_addresses()
{
    using Clock = partsink::TimestampedAddresses::Clock;

    // 2024-03-05T06:07:08Z
    auto now = Clock::time_point(std::chrono::seconds(1709618828));

    partsink::TimestampedAddresses addresses("bucket", "%Y/%m/%d/%H%M%S.json");
    addresses.with_prefix("exports/").with_clock([&now] { return now; });

    auto first = addresses.next();
    CHECK(first.has_value());
    EXPECT_STR_EQ(first->bucket, "bucket");
    EXPECT_STR_EQ(first->key, "exports/2024/03/05/060708.json");

    // the same second twice yields distinct keys
    auto second = addresses.next();
    EXPECT_STR_EQ(second->key, "exports/2024/03/05/060708.json.1");

    now += std::chrono::seconds(1);
    auto third = addresses.next();
    EXPECT_STR_EQ(third->key, "exports/2024/03/05/060709.json");
}

void
check_generated_addresses()
{
    int n = 0;
    partsink::GeneratedAddresses addresses(
      [&n]() -> std::optional<partsink::ObjectAddress> {
          if (n == 2) {
              return std::nullopt;
          }
          return partsink::ObjectAddress("bucket",
                                         "part-" + std::to_string(n++));
      });

    EXPECT_STR_EQ(addresses.next()->key, "part-0");
    EXPECT_STR_EQ(addresses.next()->key, "part-1");
    CHECK(!addresses.next().has_value());

    // once exhausted, the generator is not called again
    n = 0;
    CHECK(!addresses.next().has_value());
}
} // namespace

int
main()
{
    int retval = 1;

    try {
        check_address_list();
        check_timestamped_addresses();
        check_generated_addresses();

        retval = 0;
    } catch (const std::exception& exc) {
        LOG_ERROR("Caught exception: ", exc.what());
    }

    return retval;
}
