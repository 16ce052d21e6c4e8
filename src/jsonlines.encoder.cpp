#include "common.hh"
#include "macros.hh"
#include "partsink/jsonlines.encoder.hh"

void
partsink::JsonLinesEncoder::encode(const nlohmann::json& record,
                                   std::vector<std::byte>& out) const
{
    std::string line;
    try {
        line = record.dump();
    } catch (const nlohmann::json::type_error& exc) {
        const std::string err =
          LOG_ERROR("Failed to encode record as JSON: ", exc.what());
        throw EncodingError(err);
    }

    out.reserve(out.size() + line.size() + 1);
    append_bytes(out, line);
    append_bytes(out, "\n");
}
