#pragma once

#include "partsink/upload.sink.hh"

#include <cstddef>
#include <vector>

namespace partsink {
/**
 * @brief Whether an encoder writes its header at the start of every object or
 * only of the first one.
 */
enum class HeaderPolicy
{
    EveryObject,
    FirstObjectOnly,
};

/**
 * @brief Hook the per-object bytes of @p encoder into a sink.
 *
 * An encoder turns records into bytes appended to a buffer. It provides
 *   - `record_type`, the type of the records it encodes,
 *   - `void begin_object(std::vector<std::byte>&)`, called before the first
 *     record of every object,
 *   - `void encode(const record_type&, std::vector<std::byte>&)`,
 *   - `void finalize(std::vector<std::byte>&)`, called after the last record
 *     of every object.
 * @p encoder must outlive the returned framing.
 */
template<typename Encoder>
ObjectFraming
make_framing(Encoder& encoder)
{
    return {
        [&encoder](std::vector<std::byte>& out) { encoder.begin_object(out); },
        [&encoder](std::vector<std::byte>& out) { encoder.finalize(out); },
    };
}
} // namespace partsink
