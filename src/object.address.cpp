#include "partsink/object.address.hh"

#include <ostream>
#include <stdexcept>

namespace {
constexpr std::string_view s3_scheme = "s3://";

std::string_view
strip_trailing_slashes(std::string_view s)
{
    while (!s.empty() && s.back() == '/') {
        s.remove_suffix(1);
    }
    return s;
}
} // namespace

partsink::ObjectAddress::ObjectAddress(std::string_view bucket,
                                       std::string_view key)
  : bucket{ strip_trailing_slashes(bucket) }
  , key{ key }
{
}

partsink::ObjectAddress
partsink::ObjectAddress::parse(std::string_view uri)
{
    if (!uri.starts_with(s3_scheme)) {
        throw std::invalid_argument("Not an s3 URI: " + std::string(uri));
    }
    uri.remove_prefix(s3_scheme.size());

    const auto slash = uri.find('/');
    if (slash == std::string_view::npos) {
        throw std::invalid_argument("Missing object key in s3 URI: s3://" +
                                    std::string(uri));
    }

    ObjectAddress address(uri.substr(0, slash), uri.substr(slash + 1));
    if (address.empty()) {
        throw std::invalid_argument("Empty bucket or key in s3 URI: s3://" +
                                    std::string(uri));
    }

    return address;
}

bool
partsink::ObjectAddress::empty() const noexcept
{
    return bucket.empty() || key.empty();
}

std::string
partsink::ObjectAddress::to_string() const
{
    return std::string(s3_scheme) + bucket + "/" + key;
}

std::ostream&
partsink::operator<<(std::ostream& os, const ObjectAddress& address)
{
    return os << address.to_string();
}
