#pragma once

#include <filesystem>
#include <string>
#include "core/errors/service_errors.hpp"

namespace turnstile::policy {

// Sanitized form of an uploaded file name.
struct UploadName {
    std::string name;       // final path component only
    std::string extension;  // lowercase, without the dot; may be empty
};

// Filesystem and upload-name checks for files the server stores.
class PolicyGuard {
public:
    core::errors::Result<std::filesystem::path> validate_path_in_root(
        const std::filesystem::path& root,
        const std::filesystem::path& target_path) const;

    core::errors::Result<UploadName> validate_upload_name(
        const std::string& file_name) const;

    static bool is_within_root(const std::filesystem::path& root,
                               const std::filesystem::path& child);

private:
    static std::string lowercase(std::string value);
};

}  // namespace turnstile::policy
