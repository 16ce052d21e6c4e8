#include "common.hh"
#include "macros.hh"
#include "partsink/address.source.hh"

#include <ctime>

partsink::AddressList::AddressList(std::vector<ObjectAddress> addresses)
  : addresses_{ std::move(addresses) }
  , next_{ 0 }
{
    for (const auto& address : addresses_) {
        EXPECT_PROTOCOL(!address.empty(),
                        "Destination address must have a bucket and a key: '",
                        address,
                        "'");
    }
}

std::optional<partsink::ObjectAddress>
partsink::AddressList::next()
{
    if (next_ >= addresses_.size()) {
        return std::nullopt;
    }
    return addresses_[next_++];
}

size_t
partsink::AddressList::remaining() const noexcept
{
    return addresses_.size() - next_;
}

partsink::TimestampedAddresses::TimestampedAddresses(std::string bucket,
                                                     std::string key_format)
  : bucket_{ std::move(bucket) }
  , key_format_{ std::move(key_format) }
  , now_{ [] { return Clock::now(); } }
  , repeats_{ 0 }
{
    EXPECT_PROTOCOL(!is_empty_string(bucket_, "Bucket name is empty"),
                    "Invalid bucket name");
    EXPECT_PROTOCOL(!is_empty_string(key_format_, "Key format is empty"),
                    "Invalid key format");
}

partsink::TimestampedAddresses&
partsink::TimestampedAddresses::with_prefix(std::string prefix)
{
    while (!prefix.empty() && prefix.back() == '/') {
        prefix.pop_back();
    }
    prefix_ = std::move(prefix);
    return *this;
}

partsink::TimestampedAddresses&
partsink::TimestampedAddresses::with_clock(
  std::function<Clock::time_point()> now)
{
    EXPECT(now, "Clock not provided.");
    now_ = std::move(now);
    return *this;
}

std::optional<partsink::ObjectAddress>
partsink::TimestampedAddresses::next()
{
    std::string key = format_key_(now_());

    if (key == last_key_) {
        ++repeats_;
    } else {
        last_key_ = key;
        repeats_ = 0;
    }

    if (repeats_ > 0) {
        key += "." + std::to_string(repeats_);
    }

    if (!prefix_.empty()) {
        key = prefix_ + "/" + key;
    }

    return ObjectAddress(bucket_, key);
}

std::string
partsink::TimestampedAddresses::format_key_(Clock::time_point time) const
{
    const std::time_t t = Clock::to_time_t(time);
    std::tm tm{};
    EXPECT(gmtime_r(&t, &tm), "Failed to convert time to UTC");

    std::string key(key_format_.size() + 64, '\0');
    size_t n = 0;
    while ((n = std::strftime(key.data(), key.size(), key_format_.c_str(), &tm)) ==
           0) {
        EXPECT(key.size() < 4096,
               "Key format '",
               key_format_,
               "' produces an empty or oversized key");
        key.resize(2 * key.size());
    }
    key.resize(n);

    return key;
}

partsink::GeneratedAddresses::GeneratedAddresses(Generator generator)
  : generator_{ std::move(generator) }
  , exhausted_{ false }
{
    EXPECT(generator_, "Address generator not provided.");
}

std::optional<partsink::ObjectAddress>
partsink::GeneratedAddresses::next()
{
    if (exhausted_) {
        return std::nullopt;
    }

    auto address = generator_();
    if (!address) {
        exhausted_ = true;
    }
    return address;
}
