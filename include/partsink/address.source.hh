#pragma once

#include "partsink/object.address.hh"

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace partsink {
/**
 * @brief A lazily produced sequence of destination addresses.
 */
class AddressSource
{
  public:
    virtual ~AddressSource() = default;

    /** @brief The next address, or nullopt once the sequence is exhausted. */
    [[nodiscard]] virtual std::optional<ObjectAddress> next() = 0;
};

/**
 * @brief A fixed list of addresses, produced in order.
 */
class AddressList : public AddressSource
{
  public:
    explicit AddressList(std::vector<ObjectAddress> addresses);

    std::optional<ObjectAddress> next() override;

    size_t remaining() const noexcept;

  private:
    std::vector<ObjectAddress> addresses_;
    size_t next_;
};

/**
 * @brief An endless sequence of keys made by formatting the current UTC time.
 *
 * The key format is a strftime(3) pattern, e.g., "%Y/%m/%d/%H%M%S.jsonl". If
 * two consecutive keys format identically, a counter is appended to the later
 * one so that no key is produced twice.
 */
class TimestampedAddresses : public AddressSource
{
  public:
    using Clock = std::chrono::system_clock;

    TimestampedAddresses(std::string bucket, std::string key_format);

    /** @brief Put every key under @p prefix, joined with a '/'. */
    TimestampedAddresses& with_prefix(std::string prefix);

    /** @brief Replace the clock, e.g., for testing. */
    TimestampedAddresses& with_clock(std::function<Clock::time_point()> now);

    std::optional<ObjectAddress> next() override;

  private:
    std::string bucket_;
    std::string key_format_;
    std::string prefix_;
    std::function<Clock::time_point()> now_;

    std::string last_key_;
    unsigned int repeats_;

    std::string format_key_(Clock::time_point time) const;
};

/**
 * @brief Addresses produced by a callable, which returns nullopt to end the
 * sequence.
 */
class GeneratedAddresses : public AddressSource
{
  public:
    using Generator = std::function<std::optional<ObjectAddress>()>;

    explicit GeneratedAddresses(Generator generator);

    std::optional<ObjectAddress> next() override;

  private:
    Generator generator_;
    bool exhausted_;
};
} // namespace partsink
