#include "macros.hh"
#include "logship.stream.hh"
#include "naming.policy.hh"
#include "s3.object.store.hh"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstring>
#include <string_view>

namespace {
[[nodiscard]]
std::string
trim(const char* s)
{
    if (s == nullptr || *s == '\0') {
        return {};
    }

    const size_t length = strlen(s);

    // trim left
    std::string trimmed(s, length);
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
is_empty_string(const char* s, std::string_view error_msg)
{
    auto trimmed = trim(s);
    if (trimmed.empty()) {
        LOG_ERROR(error_msg);
        return true;
    }
    return false;
}

[[nodiscard]]
bool
validate_s3_settings(const LogShipS3Settings* settings)
{
    if (is_empty_string(settings->access_key_id, "S3 access key ID is empty")) {
        return false;
    }
    if (is_empty_string(settings->secret_access_key,
                        "S3 secret access key is empty")) {
        return false;
    }

    std::string trimmed = trim(settings->bucket_name);
    if (trimmed.length() < 3 || trimmed.length() > 63) {
        LOG_ERROR("Invalid length for S3 bucket name: ",
                  trimmed.length(),
                  ". Must be between 3 "
                  "and 63 characters");
        return false;
    }

    return true;
}

[[nodiscard]]
bool
validate_tags(const LogShipTag* tags, size_t tag_count)
{
    if (tag_count == 0) {
        return true;
    }

    if (tags == nullptr) {
        LOG_ERROR("Null pointer: tags");
        return false;
    }

    for (size_t i = 0; i < tag_count; ++i) {
        if (is_empty_string(tags[i].key, "Tag key is empty")) {
            return false;
        }
        if (tags[i].value == nullptr) {
            LOG_ERROR("Null pointer: value of tag ", tags[i].key);
            return false;
        }
    }

    return true;
}

// durations are added to clock readings, so keep them well clear of overflow
constexpr uint64_t max_duration_ms =
  std::chrono::duration_cast<std::chrono::milliseconds>(
    std::chrono::nanoseconds::max())
    .count() /
  2;

[[nodiscard]]
bool
validate_duration(uint64_t value_ms, std::string_view name)
{
    if (value_ms > max_duration_ms) {
        LOG_ERROR("Invalid value for ",
                  name,
                  ": ",
                  value_ms,
                  " ms. Must be at most ",
                  max_duration_ms,
                  " ms");
        return false;
    }
    return true;
}

[[nodiscard]]
bool
validate_settings(const struct LogShipStreamSettings_s* settings)
{
    if (!settings) {
        LOG_ERROR("Null pointer: settings");
        return false;
    }

    if (!settings->s3_settings) {
        LOG_ERROR("Null pointer: s3_settings");
        return false;
    }

    if (!validate_s3_settings(settings->s3_settings)) {
        return false;
    }

    if (!validate_tags(settings->tags, settings->tag_count)) {
        return false;
    }

    if (!validate_duration(settings->upload_delay_ms, "upload_delay_ms") ||
        !validate_duration(settings->rotate_every_ms, "rotate_every_ms")) {
        return false;
    }

    return true;
}
} // namespace

/* LogShipStream_s implementation */

LogShipStream_s::LogShipStream_s(const struct LogShipStreamSettings_s* settings)
  : error_()
  , error_callback_{ nullptr }
  , error_callback_user_data_{ nullptr }
{
    if (!validate_settings(settings)) {
        throw std::runtime_error("Invalid log stream settings");
    }

    commit_settings_(settings);

    // connect to the bucket
    auto store = create_store_();
    EXPECT(store, error_);

    // allocate the coordinator
    EXPECT(create_coordinator_(std::move(store)), error_);
}

LogShipStream_s::LogShipStream_s(const struct LogShipStreamSettings_s* settings,
                                 std::shared_ptr<logship::ObjectStore> store)
  : error_()
  , error_callback_{ nullptr }
  , error_callback_user_data_{ nullptr }
{
    if (!validate_settings(settings)) {
        throw std::runtime_error("Invalid log stream settings");
    }
    EXPECT(store, "Null pointer: store");

    commit_settings_(settings);

    EXPECT(create_coordinator_(std::move(store)), error_);
}

LogShipStream_s::~LogShipStream_s() noexcept
{
    coordinator_.reset();
}

size_t
LogShipStream_s::write(const void* data, size_t nbytes)
{
    if (data == nullptr || nbytes == 0) {
        return 0;
    }

    return coordinator_->write(
      { static_cast<const std::byte*>(data), nbytes });
}

bool
LogShipStream_s::flush(bool force_rotate, logship::FlushCallback&& callback)
{
    return coordinator_->flush(force_rotate, std::move(callback));
}

bool
LogShipStream_s::flush_file(logship::FlushCallback&& callback)
{
    return coordinator_->flush_file(std::move(callback));
}

LogShipStatusCode
LogShipStream_s::finalize()
{
    return coordinator_->finalize();
}

bool
LogShipStream_s::is_flush_thread() const
{
    return coordinator_->is_flush_thread();
}

std::string
LogShipStream_s::object_key() const
{
    return coordinator_->current_key();
}

const logship::StreamConfig&
LogShipStream_s::config() const
{
    return config_;
}

void
LogShipStream_s::commit_settings_(const struct LogShipStreamSettings_s* settings)
{
    const auto* s3 = settings->s3_settings;
    config_.s3 = {
        .endpoint = trim(s3->endpoint),
        .bucket_name = trim(s3->bucket_name),
        .access_key_id = trim(s3->access_key_id),
        .secret_access_key = trim(s3->secret_access_key),
        .region = trim(s3->region),
    };

    config_.folder = trim(settings->folder);

    config_.environment = trim(settings->environment);
    if (config_.environment.empty()) {
        config_.environment = logship::default_environment();
    }

    config_.compress = settings->compress;
    config_.save_logs_in_json = settings->save_logs_in_json;

    // the format string is used as given, leading/trailing spaces included
    if (settings->name_format != nullptr && *settings->name_format != '\0') {
        config_.name_format = settings->name_format;
    } else {
        config_.name_format =
          logship::default_name_format(config_.environment,
                                       logship::host_name(),
                                       config_.save_logs_in_json,
                                       config_.compress);
    }

    if (settings->upload_delay_ms > 0) {
        config_.upload_delay =
          std::chrono::milliseconds(settings->upload_delay_ms);
    }
    if (settings->buffer_size > 0) {
        config_.buffer_size = settings->buffer_size;
    }
    if (settings->rotate_every_ms > 0) {
        config_.rotate_every =
          std::chrono::milliseconds(settings->rotate_every_ms);
    }
    if (settings->max_file_size > 0) {
        config_.max_file_size = settings->max_file_size;
    }

    for (size_t i = 0; i < settings->tag_count; ++i) {
        const auto& tag = settings->tags[i];
        auto key = trim(tag.key);
        if (config_.tags.contains(key)) {
            LOG_WARNING("Duplicate tag '", key, "'. Using the last value.");
        }
        config_.tags[key] = tag.value;
    }

    config_.storage_class = trim(settings->storage_class);
    config_.server_side_encryption = trim(settings->server_side_encryption);
    config_.acl = trim(settings->acl);

    error_callback_ = settings->error_callback;
    error_callback_user_data_ = settings->error_callback_user_data;
}

void
LogShipStream_s::set_error_(const std::string& msg)
{
    error_ = msg;
}

std::shared_ptr<logship::ObjectStore>
LogShipStream_s::create_store_()
{
    try {
        auto pool =
          std::make_shared<logship::S3ConnectionPool>(1, config_.s3);
        return std::make_shared<logship::S3ObjectStore>(config_.s3.bucket_name,
                                                        pool);
    } catch (const std::exception& exc) {
        set_error_("Failed to connect to bucket '" + config_.s3.bucket_name +
                   "': " + exc.what());
    }

    return nullptr;
}

bool
LogShipStream_s::create_coordinator_(std::shared_ptr<logship::ObjectStore> store)
{
    try {
        coordinator_ = std::make_unique<logship::UploadCoordinator>(
          config_, std::move(store), [this](const std::string& msg) {
              notify_error_(msg);
          });
    } catch (const std::exception& exc) {
        set_error_(std::string("Failed to create upload coordinator: ") +
                   exc.what());
        return false;
    }

    return true;
}

void
LogShipStream_s::notify_error_(const std::string& msg)
{
    if (error_callback_) {
        error_callback_(msg.c_str(), error_callback_user_data_);
    }
}

LogShipStatusCode
finalize_stream(struct LogShipStream_s* stream)
{
    if (stream == nullptr) {
        LOG_INFO("Stream is null. Nothing to finalize.");
        return LogShipStatusCode_Success;
    }

    try {
        return stream->finalize();
    } catch (const std::exception& exc) {
        LOG_ERROR("Error finalizing log stream: ", exc.what());
    }

    return LogShipStatusCode_InternalError;
}
