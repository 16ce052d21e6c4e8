#include "common.hh"
#include "partsink/lines.encoder.hh"

partsink::LinesEncoder::LinesEncoder(std::string header, HeaderPolicy policy)
  : header_{ std::move(header) }
  , policy_{ policy }
{
}

void
partsink::LinesEncoder::begin_object(std::vector<std::byte>& out)
{
    if (!header_ ||
        (header_written_ && policy_ == HeaderPolicy::FirstObjectOnly)) {
        return;
    }

    append_bytes(out, *header_);
    append_bytes(out, "\n");
    header_written_ = true;
}

void
partsink::LinesEncoder::encode(const std::string& line,
                               std::vector<std::byte>& out) const
{
    out.reserve(out.size() + line.size() + 1);
    append_bytes(out, line);
    append_bytes(out, "\n");
}

void
partsink::LinesEncoder::finalize(std::vector<std::byte>&) const
{
}
