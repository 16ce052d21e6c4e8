#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

namespace partsink {
/**
 * @brief The destination of a multipart upload: one object in one bucket.
 */
struct ObjectAddress
{
    std::string bucket;
    std::string key;

    ObjectAddress() = default;
    ObjectAddress(std::string_view bucket, std::string_view key);

    /**
     * @brief Parse an address of the form `s3://bucket/key`.
     * @param uri The URI to parse.
     * @return The parsed address.
     * @throws std::invalid_argument if @p uri is not an s3 URI, or either the
     * bucket or the key is empty.
     */
    [[nodiscard]] static ObjectAddress parse(std::string_view uri);

    /** @brief True if either the bucket or the key is empty. */
    bool empty() const noexcept;

    /** @brief Format this address as `s3://bucket/key`. */
    std::string to_string() const;

    bool operator==(const ObjectAddress&) const = default;
};

std::ostream&
operator<<(std::ostream& os, const ObjectAddress& address);
} // namespace partsink
