#include "session/attachment_store.hpp"

#include <cctype>
#include <fstream>
#include <iterator>
#include <system_error>
#include <utility>
#include <nlohmann/json.hpp>
#include "core/config/tokens.hpp"
#include "core/logging/logger.hpp"
#include "protocol/json_codec.hpp"

namespace turnstile::session {

using core::errors::ErrorCategory;
using core::errors::ServiceError;
using nlohmann::json;

namespace {

constexpr const char* kIdPrefix = "att_";
constexpr std::size_t kIdHexLength = 16;

ServiceError not_found(const std::string& attachment_id) {
    return ServiceError{ErrorCategory::State, "Attachment not found: " + attachment_id,
                        "attachment_not_found"};
}

}  // namespace

AttachmentStore::AttachmentStore(std::filesystem::path root, const std::size_t max_bytes)
    : root_(std::move(root)), max_bytes_(max_bytes) {}

protocol::AttachmentKind AttachmentStore::kind_for_extension(const std::string& extension) {
    static const char* const kImage[] = {"png", "jpg", "jpeg", "gif", "webp", "bmp", "svg"};
    static const char* const kText[] = {"txt", "md", "json", "yaml", "yml", "toml", "csv",
                                        "log", "xml", "html", "css", "js", "ts", "py",
                                        "rs", "go", "c", "h", "cc", "cpp", "hpp", "sh"};
    for (const char* candidate : kImage) {
        if (extension == candidate) {
            return protocol::AttachmentKind::Image;
        }
    }
    for (const char* candidate : kText) {
        if (extension == candidate) {
            return protocol::AttachmentKind::Text;
        }
    }
    return protocol::AttachmentKind::File;
}

bool AttachmentStore::is_valid_id(const std::string& attachment_id) {
    const std::string prefix = kIdPrefix;
    if (attachment_id.size() != prefix.size() + kIdHexLength ||
        attachment_id.compare(0, prefix.size(), prefix) != 0) {
        return false;
    }
    for (std::size_t i = prefix.size(); i < attachment_id.size(); ++i) {
        if (!std::isxdigit(static_cast<unsigned char>(attachment_id[i]))) {
            return false;
        }
    }
    return true;
}

std::filesystem::path AttachmentStore::workdir_dir(const protocol::WorkdirId workdir_id) const {
    return root_ / "attachments" / ("w" + std::to_string(workdir_id));
}

std::string AttachmentStore::blob_name(const std::string& id, const std::string& extension) {
    return extension.empty() ? id + ".bin" : id + "." + extension;
}

core::errors::Result<protocol::AttachmentRef> AttachmentStore::store(
    const protocol::WorkdirId workdir_id, const std::string& file_name,
    const std::string_view bytes, std::optional<std::string> mime) {
    if (bytes.size() > max_bytes_) {
        return ServiceError{ErrorCategory::Input,
                            "Attachment exceeds " + std::to_string(max_bytes_) + " bytes.",
                            "attachment_too_large"};
    }
    auto validated_name = policy_.validate_upload_name(file_name);
    if (core::errors::is_error(validated_name)) {
        return core::errors::get_error(validated_name);
    }
    const auto& upload = core::errors::get_value(validated_name);

    const auto dir = workdir_dir(workdir_id);
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        return ServiceError{ErrorCategory::Internal,
                            "Unable to create attachment directory: " + dir.string(),
                            "attachment_dir_create_failed"};
    }

    protocol::AttachmentRef ref;
    ref.id = core::config::generate_token(kIdPrefix, static_cast<int>(kIdHexLength));
    ref.kind = kind_for_extension(upload.extension);
    ref.name = upload.name;
    ref.extension = upload.extension;
    if (mime.has_value() && !mime->empty()) {
        ref.mime = std::move(mime);
    }
    ref.byte_len = bytes.size();

    const auto blob_path = dir / blob_name(ref.id, ref.extension);
    {
        std::ofstream out(blob_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            return ServiceError{ErrorCategory::Internal,
                                "Unable to open attachment file: " + blob_path.string(),
                                "attachment_write_failed"};
        }
        out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        if (!out.good()) {
            return ServiceError{ErrorCategory::Internal,
                                "Unable to write attachment file: " + blob_path.string(),
                                "attachment_write_failed"};
        }
    }

    const auto sidecar_path = dir / (ref.id + ".json");
    std::ofstream sidecar(sidecar_path, std::ios::trunc);
    if (!sidecar.is_open()) {
        return ServiceError{ErrorCategory::Internal,
                            "Unable to open attachment metadata: " + sidecar_path.string(),
                            "attachment_write_failed"};
    }
    sidecar << protocol::codec::to_json(ref).dump() << "\n";
    if (!sidecar.good()) {
        return ServiceError{ErrorCategory::Internal,
                            "Unable to write attachment metadata: " + sidecar_path.string(),
                            "attachment_write_failed"};
    }

    LOG_INFO("AttachmentStore: stored " + ref.id + " (" + std::to_string(ref.byte_len) +
             " bytes) for workdir " + std::to_string(workdir_id));
    return ref;
}

core::errors::Result<StoredAttachment> AttachmentStore::find(
    const protocol::WorkdirId workdir_id, const std::string& attachment_id) const {
    if (!is_valid_id(attachment_id)) {
        return not_found(attachment_id);
    }

    const auto dir = workdir_dir(workdir_id);
    std::ifstream in(dir / (attachment_id + ".json"));
    if (!in.is_open()) {
        return not_found(attachment_id);
    }
    const json sidecar = json::parse(in, nullptr, false);
    if (sidecar.is_discarded()) {
        LOG_WARN("AttachmentStore: unreadable metadata for " + attachment_id);
        return not_found(attachment_id);
    }
    auto decoded = protocol::codec::decode_attachment(sidecar);
    if (core::errors::is_error(decoded)) {
        LOG_WARN("AttachmentStore: invalid metadata for " + attachment_id + ": " +
                 core::errors::get_error(decoded).message);
        return not_found(attachment_id);
    }

    StoredAttachment stored;
    stored.ref = core::errors::get_value(decoded);
    if (stored.ref.id != attachment_id) {
        return not_found(attachment_id);
    }
    // The blob must resolve inside this workdir's directory.
    auto confined =
        policy_.validate_path_in_root(dir, blob_name(stored.ref.id, stored.ref.extension));
    if (core::errors::is_error(confined)) {
        LOG_WARN("AttachmentStore: metadata for " + attachment_id + " points outside " +
                 dir.string() + " [" + core::errors::get_error(confined).code + "]");
        return not_found(attachment_id);
    }
    stored.path = core::errors::get_value(confined);
    std::error_code ec;
    if (!std::filesystem::is_regular_file(stored.path, ec)) {
        return not_found(attachment_id);
    }
    return stored;
}

core::errors::Result<std::string> AttachmentStore::read(
    const protocol::WorkdirId workdir_id, const std::string& attachment_id) const {
    auto found = find(workdir_id, attachment_id);
    if (core::errors::is_error(found)) {
        return core::errors::get_error(found);
    }
    const auto& path = core::errors::get_value(found).path;
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return ServiceError{ErrorCategory::Internal,
                            "Unable to open attachment file: " + path.string(),
                            "attachment_read_failed"};
    }
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

}  // namespace turnstile::session
