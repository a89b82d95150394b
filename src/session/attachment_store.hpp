#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include "core/errors/service_errors.hpp"
#include "policy/policy_guard.hpp"
#include "protocol/conversation_contract.hpp"
#include "protocol/task_contract.hpp"

namespace turnstile::session {

struct StoredAttachment {
    protocol::AttachmentRef ref;
    std::filesystem::path path;
};

// Uploaded blobs, one directory per workdir:
//   <root>/attachments/w<workdir_id>/<id>.<ext>   raw bytes
//   <root>/attachments/w<workdir_id>/<id>.json    AttachmentRef sidecar
class AttachmentStore {
public:
    AttachmentStore(std::filesystem::path root, std::size_t max_bytes);

    core::errors::Result<protocol::AttachmentRef> store(
        protocol::WorkdirId workdir_id, const std::string& file_name,
        std::string_view bytes, std::optional<std::string> mime = std::nullopt);

    core::errors::Result<StoredAttachment> find(protocol::WorkdirId workdir_id,
                                                const std::string& attachment_id) const;
    core::errors::Result<std::string> read(protocol::WorkdirId workdir_id,
                                           const std::string& attachment_id) const;

    std::size_t max_bytes() const { return max_bytes_; }
    const std::filesystem::path& root() const { return root_; }

    static protocol::AttachmentKind kind_for_extension(const std::string& extension);
    static bool is_valid_id(const std::string& attachment_id);

private:
    std::filesystem::path workdir_dir(protocol::WorkdirId workdir_id) const;
    static std::string blob_name(const std::string& id, const std::string& extension);

    std::filesystem::path root_;
    std::size_t max_bytes_;
    policy::PolicyGuard policy_;
};

}  // namespace turnstile::session
