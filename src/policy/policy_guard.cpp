#include "policy/policy_guard.hpp"

#include <algorithm>
#include <cctype>
#include <system_error>
#include <utility>

namespace turnstile::policy {

using core::errors::ErrorCategory;
using core::errors::ServiceError;

namespace {

constexpr std::size_t kMaxUploadNameLength = 255;
constexpr std::size_t kMaxExtensionLength = 16;

}  // namespace

bool PolicyGuard::is_within_root(const std::filesystem::path& root,
                                 const std::filesystem::path& child) {
    auto root_it = root.begin();
    auto child_it = child.begin();
    for (; root_it != root.end() && child_it != child.end(); ++root_it, ++child_it) {
        if (*root_it != *child_it) {
            return false;
        }
    }
    return root_it == root.end();
}

std::string PolicyGuard::lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](const unsigned char c) {
                       return static_cast<char>(std::tolower(c));
                   });
    return value;
}

core::errors::Result<std::filesystem::path> PolicyGuard::validate_path_in_root(
    const std::filesystem::path& root,
    const std::filesystem::path& target_path) const {
    std::error_code ec;
    if (!std::filesystem::is_directory(root, ec) || ec) {
        return ServiceError{ErrorCategory::Internal,
                            "Storage root is not a directory: " + root.string(),
                            "invalid_storage_root"};
    }

    const std::filesystem::path canonical_root =
        std::filesystem::weakly_canonical(root, ec);
    if (ec) {
        return ServiceError{ErrorCategory::Internal,
                            "Unable to resolve storage root: " + root.string(),
                            "invalid_storage_root"};
    }

    std::filesystem::path candidate = target_path;
    if (candidate.is_relative()) {
        candidate = canonical_root / candidate;
    }

    const std::filesystem::path canonical_candidate =
        std::filesystem::weakly_canonical(candidate, ec);
    if (ec) {
        return ServiceError{ErrorCategory::Input,
                            "Unable to resolve target path: " + target_path.string(),
                            "invalid_path"};
    }

    if (!is_within_root(canonical_root, canonical_candidate)) {
        return ServiceError{ErrorCategory::Input,
                            "Path escapes storage root: " +
                                canonical_candidate.string(),
                            "path_outside_root"};
    }

    return canonical_candidate;
}

core::errors::Result<UploadName> PolicyGuard::validate_upload_name(
    const std::string& file_name) const {
    // Browsers may send a full client-side path; keep the last component.
    std::string name = file_name;
    const auto slash = name.find_last_of("/\\");
    if (slash != std::string::npos) {
        name = name.substr(slash + 1);
    }
    if (name.empty() || name == "." || name == "..") {
        return ServiceError{ErrorCategory::Input, "Upload has no usable file name.",
                            "invalid_upload_name"};
    }
    if (name.size() > kMaxUploadNameLength) {
        return ServiceError{ErrorCategory::Input, "Upload file name is too long.",
                            "invalid_upload_name"};
    }
    for (const char c : name) {
        if (static_cast<unsigned char>(c) < 0x20) {
            return ServiceError{ErrorCategory::Input,
                                "Upload file name contains control characters.",
                                "invalid_upload_name"};
        }
    }

    UploadName upload;
    upload.name = name;
    const auto dot = name.find_last_of('.');
    if (dot != std::string::npos && dot > 0 && dot + 1 < name.size()) {
        std::string extension = lowercase(name.substr(dot + 1));
        const bool alnum = std::all_of(extension.begin(), extension.end(),
                                       [](const unsigned char c) {
                                           return std::isalnum(c) != 0;
                                       });
        if (alnum && extension.size() <= kMaxExtensionLength) {
            upload.extension = std::move(extension);
        }
    }
    return upload;
}

}  // namespace turnstile::policy
