#include "common.hh"
#include "macros.hh"
#include "partsink/file.upload.client.hh"

#include <chrono>
#include <fstream>
#include <type_traits>

namespace fs = std::filesystem;

namespace {
template<typename T, typename F>
std::future<T>
run_now(F&& request)
{
    std::promise<T> promise;
    try {
        if constexpr (std::is_void_v<T>) {
            request();
            promise.set_value();
        } else {
            promise.set_value(request());
        }
    } catch (const std::exception&) {
        promise.set_exception(std::current_exception());
    }

    return promise.get_future();
}

std::vector<std::byte>
read_file(const fs::path& path)
{
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    EXPECT(file.is_open(), "Failed to open ", path);

    std::vector<std::byte> data(static_cast<size_t>(file.tellg()));
    file.seekg(0);
    file.read(reinterpret_cast<char*>(data.data()),
              static_cast<std::streamsize>(data.size()));
    EXPECT(file.good() || data.empty(), "Failed to read ", path);

    return data;
}

// True if the normalized @p path lies strictly below @p dir.
bool
is_below(const fs::path& dir, const fs::path& path)
{
    const auto relative = path.lexically_relative(dir);
    return !relative.empty() && relative != "." && *relative.begin() != "..";
}
} // namespace

partsink::FileUploadClient::FileUploadClient(fs::path root)
  : root_{ std::move(root) }
  , n_created_{ 0 }
{
    std::error_code ec;
    if (!fs::is_directory(root_) && !fs::create_directories(root_, ec)) {
        const std::string err = LOG_ERROR(
          "Failed to create directory ", root_, ": ", ec.message());
        throw std::runtime_error(err);
    }
}

std::future<std::string>
partsink::FileUploadClient::create_upload(const ObjectAddress& address)
{
    return run_now<std::string>([&] {
        (void)object_path(address);

        std::scoped_lock lock(mutex_);

        const auto ticks =
          std::chrono::system_clock::now().time_since_epoch().count();
        std::string upload_id =
          std::to_string(ticks) + "-" + std::to_string(++n_created_);

        std::error_code ec;
        fs::create_directories(staging_dir_(upload_id), ec);
        EXPECT(!ec,
               "Failed to create staging directory for ",
               address,
               ": ",
               ec.message());

        uploads_.emplace(upload_id, address);
        return upload_id;
    });
}

std::future<std::string>
partsink::FileUploadClient::upload_part(const ObjectAddress& address,
                                        const std::string& upload_id,
                                        unsigned int part_number,
                                        std::span<const std::byte> data)
{
    return run_now<std::string>([&] {
        check_upload_(address, upload_id);
        EXPECT(part_number > 0, "Part number must be positive.");

        const auto path = part_path_(upload_id, part_number);
        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        EXPECT(file.is_open(), "Failed to open ", path);

        file.write(reinterpret_cast<const char*>(data.data()),
                   static_cast<std::streamsize>(data.size()));
        EXPECT(file.good(), "Failed to write part ", part_number, " to ", path);

        return content_digest(data);
    });
}

std::future<std::string>
partsink::FileUploadClient::complete_upload(
  const ObjectAddress& address,
  const std::string& upload_id,
  const std::vector<CompletedPart>& parts)
{
    return run_now<std::string>([&] {
        check_upload_(address, upload_id);
        EXPECT(!parts.empty(), "Parts list must not be empty.");

        const auto path = object_path(address);
        fs::create_directories(path.parent_path());

        // assemble next to the destination, then move into place
        auto tmp_path = path;
        tmp_path += "." + upload_id + ".partial";

        std::string etags;
        {
            std::ofstream object(tmp_path, std::ios::binary | std::ios::trunc);
            EXPECT(object.is_open(), "Failed to open ", tmp_path);

            for (const auto& part : parts) {
                const auto data = read_file(part_path_(upload_id, part.number));
                EXPECT(content_digest(data) == part.etag,
                       "Part ",
                       part.number,
                       " of upload ",
                       upload_id,
                       " does not match its etag");

                object.write(reinterpret_cast<const char*>(data.data()),
                             static_cast<std::streamsize>(data.size()));
                etags += part.etag;
            }
            EXPECT(object.good(), "Failed to write ", tmp_path);
        }

        fs::rename(tmp_path, path);
        fs::remove_all(staging_dir_(upload_id));
        {
            std::scoped_lock lock(mutex_);
            uploads_.erase(upload_id);
        }

        std::vector<std::byte> etag_bytes;
        append_bytes(etag_bytes, etags);
        return content_digest(etag_bytes) + "-" + std::to_string(parts.size());
    });
}

std::future<void>
partsink::FileUploadClient::abort_upload(const ObjectAddress& address,
                                         const std::string& upload_id)
{
    return run_now<void>([&] {
        check_upload_(address, upload_id);

        fs::remove_all(staging_dir_(upload_id));

        std::scoped_lock lock(mutex_);
        uploads_.erase(upload_id);
    });
}

fs::path
partsink::FileUploadClient::object_path(const ObjectAddress& address) const
{
    const fs::path bucket(address.bucket);
    const fs::path key(address.key);
    EXPECT(bucket.is_relative() && key.is_relative(),
           "Bucket and key of ",
           address,
           " must be relative paths");

    const auto root = root_.lexically_normal();
    const auto bucket_dir = (root / bucket).lexically_normal();
    const auto path = (bucket_dir / key).lexically_normal();
    EXPECT(is_below(root, bucket_dir) && is_below(bucket_dir, path) &&
             bucket_dir.lexically_relative(root) != ".uploads",
           "Address ",
           address,
           " resolves outside of ",
           root_);

    return path;
}

fs::path
partsink::FileUploadClient::staging_dir_(const std::string& upload_id) const
{
    return root_ / ".uploads" / upload_id;
}

fs::path
partsink::FileUploadClient::part_path_(const std::string& upload_id,
                                       unsigned int part_number) const
{
    return staging_dir_(upload_id) / std::to_string(part_number);
}

void
partsink::FileUploadClient::check_upload_(const ObjectAddress& address,
                                          const std::string& upload_id)
{
    std::scoped_lock lock(mutex_);

    auto it = uploads_.find(upload_id);
    EXPECT(it != uploads_.end(), "No such upload: ", upload_id);
    EXPECT(it->second == address,
           "Upload ",
           upload_id,
           " belongs to ",
           it->second,
           ", not ",
           address);
}
