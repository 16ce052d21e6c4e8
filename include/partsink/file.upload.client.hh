#pragma once

#include "partsink/upload.client.hh"

#include <filesystem>
#include <map>
#include <mutex>
#include <string>

namespace partsink {
/**
 * @brief Uploads to a directory on the local filesystem.
 *
 * Parts are staged under `<root>/.uploads/<upload id>/` and concatenated into
 * `<root>/<bucket>/<key>` on completion. Requests complete before they return.
 */
class FileUploadClient : public UploadClient
{
  public:
    /** @throws std::runtime_error if @p root cannot be created. */
    explicit FileUploadClient(std::filesystem::path root);

    std::future<std::string> create_upload(
      const ObjectAddress& address) override;
    std::future<std::string> upload_part(const ObjectAddress& address,
                                         const std::string& upload_id,
                                         unsigned int part_number,
                                         std::span<const std::byte> data) override;
    std::future<std::string> complete_upload(
      const ObjectAddress& address,
      const std::string& upload_id,
      const std::vector<CompletedPart>& parts) override;
    std::future<void> abort_upload(const ObjectAddress& address,
                                   const std::string& upload_id) override;

    /**
     * @brief Where the object at @p address is written.
     * @throws std::runtime_error if the bucket or key would place the object
     * outside of its bucket directory under the root.
     */
    std::filesystem::path object_path(const ObjectAddress& address) const;

    const std::filesystem::path& root() const noexcept { return root_; }

  private:
    std::filesystem::path root_;

    std::mutex mutex_;
    std::map<std::string, ObjectAddress> uploads_;
    unsigned int n_created_;

    std::filesystem::path staging_dir_(const std::string& upload_id) const;
    std::filesystem::path part_path_(const std::string& upload_id,
                                     unsigned int part_number) const;
    void check_upload_(const ObjectAddress& address,
                       const std::string& upload_id);
};
} // namespace partsink
