#pragma once

#include "partsink/object.address.hh"

#include <cstddef>
#include <future>
#include <span>
#include <string>
#include <vector>

namespace partsink {
/**
 * @brief A part acknowledged by the remote service.
 */
struct CompletedPart
{
    unsigned int number{ 0 };
    std::string etag;
    size_t size{ 0 };
};

/**
 * @brief The four operations of the multipart upload protocol.
 *
 * Every operation returns a future; a failed operation stores its error in
 * the future. Implementations copy what they need from their arguments before
 * returning, except for the payload of upload_part(), which the caller keeps
 * alive until the returned future is ready.
 *
 * Retries, authentication and transport are the implementation's concern.
 * A client outlives every upload that holds it; uploads share it through
 * std::shared_ptr and never look up a default instance.
 */
class UploadClient
{
  public:
    virtual ~UploadClient() = default;

    /**
     * @brief Begin a multipart upload.
     * @return A future holding the upload id.
     */
    [[nodiscard]] virtual std::future<std::string> create_upload(
      const ObjectAddress& address) = 0;

    /**
     * @brief Upload one part.
     * @return A future holding the entity tag of the part.
     */
    [[nodiscard]] virtual std::future<std::string> upload_part(
      const ObjectAddress& address,
      const std::string& upload_id,
      unsigned int part_number,
      std::span<const std::byte> data) = 0;

    /**
     * @brief Assemble the uploaded parts into the object.
     * @param parts All parts of the upload, sorted by part number.
     * @return A future holding the entity tag of the object.
     */
    [[nodiscard]] virtual std::future<std::string> complete_upload(
      const ObjectAddress& address,
      const std::string& upload_id,
      const std::vector<CompletedPart>& parts) = 0;

    /** @brief Discard an upload and any parts uploaded to it. */
    [[nodiscard]] virtual std::future<void> abort_upload(
      const ObjectAddress& address,
      const std::string& upload_id) = 0;
};
} // namespace partsink
