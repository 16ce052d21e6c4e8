#include "common.hh"
#include "macros.hh"
#include "partsink/memory.upload.client.hh"

#include <memory>
#include <stdexcept>

namespace {
std::exception_ptr
make_error(const std::string& message)
{
    return std::make_exception_ptr(std::runtime_error(message));
}
} // namespace

partsink::MemoryUploadClient::MemoryUploadClient(size_t min_part_size)
  : min_part_size_{ min_part_size }
  , n_created_{ 0 }
  , deferred_{ false }
{
}

std::future<std::string>
partsink::MemoryUploadClient::create_upload(const ObjectAddress& address)
{
    std::scoped_lock lock(mutex_);
    calls_.push_back({ RemoteOperation::CreateUpload, address });

    if (auto error = take_failure_(RemoteOperation::CreateUpload)) {
        return settle_({}, error);
    }

    std::string upload_id = "upload-" + std::to_string(++n_created_);
    uploads_.emplace(upload_id, ActiveUpload{ address, {} });

    return settle_(upload_id, nullptr);
}

std::future<std::string>
partsink::MemoryUploadClient::upload_part(const ObjectAddress& address,
                                          const std::string& upload_id,
                                          unsigned int part_number,
                                          std::span<const std::byte> data)
{
    std::scoped_lock lock(mutex_);
    calls_.push_back(
      { RemoteOperation::UploadPart, address, upload_id, part_number, data.size() });

    if (auto error = take_failure_(RemoteOperation::UploadPart)) {
        return settle_({}, error);
    }

    auto it = uploads_.find(upload_id);
    if (it == uploads_.end() || it->second.address != address) {
        return settle_({}, make_error("NoSuchUpload: " + upload_id));
    }
    if (part_number < 1 || part_number > protocol_max_part_count) {
        return settle_(
          {}, make_error("InvalidArgument: part number " +
                         std::to_string(part_number)));
    }
    if (data.size() > protocol_max_part_size) {
        return settle_({}, make_error("EntityTooLarge"));
    }

    it->second.parts[part_number] =
      std::vector<std::byte>(data.begin(), data.end());

    return settle_(content_digest(data), nullptr);
}

std::future<std::string>
partsink::MemoryUploadClient::complete_upload(
  const ObjectAddress& address,
  const std::string& upload_id,
  const std::vector<CompletedPart>& parts)
{
    std::scoped_lock lock(mutex_);

    Call call{ RemoteOperation::CompleteUpload, address, upload_id };
    for (const auto& part : parts) {
        call.part_numbers.push_back(part.number);
    }
    calls_.push_back(std::move(call));

    if (auto error = take_failure_(RemoteOperation::CompleteUpload)) {
        return settle_({}, error);
    }

    auto it = uploads_.find(upload_id);
    if (it == uploads_.end() || it->second.address != address) {
        return settle_({}, make_error("NoSuchUpload: " + upload_id));
    }
    if (parts.empty()) {
        return settle_({}, make_error("MalformedXML: no parts"));
    }

    const auto& uploaded = it->second.parts;
    std::string contents;
    std::string etags;
    unsigned int previous = 0;
    for (size_t i = 0; i < parts.size(); ++i) {
        const auto& part = parts[i];
        if (part.number <= previous) {
            return settle_({}, make_error("InvalidPartOrder"));
        }
        previous = part.number;

        auto found = uploaded.find(part.number);
        if (found == uploaded.end() ||
            content_digest(found->second) != part.etag) {
            return settle_({},
                           make_error("InvalidPart: " +
                                      std::to_string(part.number)));
        }

        const auto& data = found->second;
        if (i + 1 < parts.size() && data.size() < min_part_size_) {
            return settle_({},
                           make_error("EntityTooSmall: part " +
                                      std::to_string(part.number)));
        }

        contents.append(reinterpret_cast<const char*>(data.data()),
                        data.size());
        etags += part.etag;
    }

    std::vector<std::byte> etag_bytes;
    append_bytes(etag_bytes, etags);
    const auto etag =
      content_digest(etag_bytes) + "-" + std::to_string(parts.size());

    objects_[address.to_string()] = std::move(contents);
    uploads_.erase(it);

    return settle_(etag, nullptr);
}

std::future<void>
partsink::MemoryUploadClient::abort_upload(const ObjectAddress& address,
                                           const std::string& upload_id)
{
    std::scoped_lock lock(mutex_);
    calls_.push_back({ RemoteOperation::AbortUpload, address, upload_id });

    std::promise<void> promise;
    if (auto error = take_failure_(RemoteOperation::AbortUpload)) {
        promise.set_exception(error);
    } else if (uploads_.erase(upload_id) == 0) {
        promise.set_exception(make_error("NoSuchUpload: " + upload_id));
    } else {
        promise.set_value();
    }

    return promise.get_future();
}

void
partsink::MemoryUploadClient::fail_next(RemoteOperation operation,
                                        std::string message)
{
    std::scoped_lock lock(mutex_);
    failures_[operation] = std::move(message);
}

void
partsink::MemoryUploadClient::set_deferred(bool deferred)
{
    {
        std::scoped_lock lock(mutex_);
        deferred_ = deferred;
    }

    if (!deferred) {
        release_pending();
    }
}

size_t
partsink::MemoryUploadClient::release_pending()
{
    std::vector<std::function<void()>> held;
    {
        std::scoped_lock lock(mutex_);
        held.swap(held_);
    }

    for (auto& deliver : held) {
        deliver();
    }

    return held.size();
}

std::vector<partsink::MemoryUploadClient::Call>
partsink::MemoryUploadClient::calls() const
{
    std::scoped_lock lock(mutex_);
    return calls_;
}

size_t
partsink::MemoryUploadClient::count(RemoteOperation operation) const
{
    std::scoped_lock lock(mutex_);

    size_t n = 0;
    for (const auto& call : calls_) {
        if (call.operation == operation) {
            ++n;
        }
    }
    return n;
}

std::optional<std::string>
partsink::MemoryUploadClient::object(const ObjectAddress& address) const
{
    std::scoped_lock lock(mutex_);

    auto it = objects_.find(address.to_string());
    if (it == objects_.end()) {
        return std::nullopt;
    }
    return it->second;
}

size_t
partsink::MemoryUploadClient::n_objects() const
{
    std::scoped_lock lock(mutex_);
    return objects_.size();
}

size_t
partsink::MemoryUploadClient::n_active_uploads() const
{
    std::scoped_lock lock(mutex_);
    return uploads_.size();
}

std::exception_ptr
partsink::MemoryUploadClient::take_failure_(RemoteOperation operation)
{
    auto it = failures_.find(operation);
    if (it == failures_.end()) {
        return nullptr;
    }

    auto error = make_error(it->second);
    failures_.erase(it);
    return error;
}

std::future<std::string>
partsink::MemoryUploadClient::settle_(std::string value,
                                      std::exception_ptr error)
{
    auto promise = std::make_shared<std::promise<std::string>>();
    auto future = promise->get_future();

    hold_or_run_([promise, value = std::move(value), error] {
        if (error) {
            promise->set_exception(error);
        } else {
            promise->set_value(value);
        }
    });

    return future;
}

void
partsink::MemoryUploadClient::hold_or_run_(std::function<void()>&& deliver)
{
    if (deferred_) {
        held_.push_back(std::move(deliver));
    } else {
        deliver();
    }
}
