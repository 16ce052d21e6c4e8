#include "common.hh"
#include "macros.hh"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <iomanip>
#include <sstream>

std::string
partsink::trim(std::string_view s)
{
    if (s.empty()) {
        return {};
    }

    // trim left
    std::string trimmed(s);
    trimmed.erase(trimmed.begin(),
                  std::find_if(trimmed.begin(), trimmed.end(), [](char c) {
                      return !std::isspace(static_cast<unsigned char>(c));
                  }));

    // trim right
    trimmed.erase(std::find_if(trimmed.rbegin(),
                               trimmed.rend(),
                               [](char c) {
                                   return !std::isspace(
                                     static_cast<unsigned char>(c));
                               })
                    .base(),
                  trimmed.end());

    return trimmed;
}

bool
partsink::is_empty_string(std::string_view s, std::string_view err_on_empty)
{
    auto trimmed = trim(s);
    if (trimmed.empty()) {
        LOG_ERROR(err_on_empty);
        return true;
    }
    return false;
}

void
partsink::append_bytes(std::vector<std::byte>& out, std::string_view s)
{
    const auto* begin = reinterpret_cast<const std::byte*>(s.data());
    out.insert(out.end(), begin, begin + s.size());
}

std::string
partsink::content_digest(std::span<const std::byte> data)
{
    uint64_t hash = 0xcbf29ce484222325ull;
    for (const auto b : data) {
        hash ^= static_cast<uint64_t>(b);
        hash *= 0x100000001b3ull;
    }

    std::ostringstream ss;
    ss << std::hex << std::setw(16) << std::setfill('0') << hash;
    return ss.str();
}
