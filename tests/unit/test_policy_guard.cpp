#include <filesystem>
#include <fstream>
#include <string>
#include <gtest/gtest.h>
#include "core/config/tokens.hpp"
#include "core/errors/service_errors.hpp"
#include "policy/policy_guard.hpp"

namespace {

using turnstile::core::errors::get_error;
using turnstile::core::errors::get_value;
using turnstile::core::errors::is_error;
using turnstile::policy::PolicyGuard;

class TempWorkspace {
public:
    TempWorkspace() {
        root_ = std::filesystem::temp_directory_path() /
                ("turnstile_policy_" + turnstile::core::config::generate_token("", 12));
        std::filesystem::create_directories(root_ / "sub");
    }

    ~TempWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

void write_file(const std::filesystem::path& path, const std::string& content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path);
    out << content;
}

TEST(PolicyGuardTest, AllowsPathInsideRoot) {
    TempWorkspace workspace;
    write_file(workspace.root() / "sub/sample.txt", "ok");

    PolicyGuard guard;
    auto result = guard.validate_path_in_root(workspace.root(), "sub/sample.txt");
    ASSERT_FALSE(is_error(result));

    const auto resolved = get_value(result);
    EXPECT_TRUE(resolved.is_absolute());
    EXPECT_EQ(resolved.filename().string(), "sample.txt");
}

TEST(PolicyGuardTest, RejectsDotDotEscape) {
    TempWorkspace workspace;

    PolicyGuard guard;
    auto result = guard.validate_path_in_root(workspace.root(), "sub/../../elsewhere.txt");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "path_outside_root");
}

TEST(PolicyGuardTest, RejectsAbsolutePathOutsideRoot) {
    TempWorkspace workspace;
    const auto outside = workspace.root().parent_path() / "outside.txt";

    PolicyGuard guard;
    auto result = guard.validate_path_in_root(workspace.root(), outside);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "path_outside_root");
}

TEST(PolicyGuardTest, RejectsMissingRoot) {
    PolicyGuard guard;
    const auto missing_root =
        std::filesystem::temp_directory_path() /
        ("turnstile_missing_" + turnstile::core::config::generate_token("", 12));
    auto result = guard.validate_path_in_root(missing_root, "a.txt");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_storage_root");
}

TEST(PolicyGuardTest, WithinRootComparesWholeComponents) {
    EXPECT_TRUE(PolicyGuard::is_within_root("/srv/data", "/srv/data/a/b"));
    EXPECT_TRUE(PolicyGuard::is_within_root("/srv/data", "/srv/data"));
    EXPECT_FALSE(PolicyGuard::is_within_root("/srv/data", "/srv/database"));
    EXPECT_FALSE(PolicyGuard::is_within_root("/srv/data", "/srv"));
}

TEST(PolicyGuardTest, UploadNameKeepsLastComponent) {
    PolicyGuard guard;
    auto result = guard.validate_upload_name("C:\\Users\\me\\Screenshot.PNG");
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).name, "Screenshot.PNG");
    EXPECT_EQ(get_value(result).extension, "png");

    auto posix = guard.validate_upload_name("../../etc/notes.md");
    ASSERT_FALSE(is_error(posix));
    EXPECT_EQ(get_value(posix).name, "notes.md");
    EXPECT_EQ(get_value(posix).extension, "md");
}

TEST(PolicyGuardTest, UploadNameWithoutUsableExtension) {
    PolicyGuard guard;
    auto dotfile = guard.validate_upload_name(".bashrc");
    ASSERT_FALSE(is_error(dotfile));
    EXPECT_EQ(get_value(dotfile).extension, "");

    auto trailing = guard.validate_upload_name("archive.");
    ASSERT_FALSE(is_error(trailing));
    EXPECT_EQ(get_value(trailing).extension, "");

    auto odd = guard.validate_upload_name("data.t-x");
    ASSERT_FALSE(is_error(odd));
    EXPECT_EQ(get_value(odd).extension, "");
}

TEST(PolicyGuardTest, RejectsUnusableUploadNames) {
    PolicyGuard guard;
    EXPECT_EQ(get_error(guard.validate_upload_name("")).code, "invalid_upload_name");
    EXPECT_EQ(get_error(guard.validate_upload_name("dir/")).code, "invalid_upload_name");
    EXPECT_EQ(get_error(guard.validate_upload_name("..")).code, "invalid_upload_name");
    EXPECT_EQ(get_error(guard.validate_upload_name("bad\nname.txt")).code,
              "invalid_upload_name");
    EXPECT_EQ(get_error(guard.validate_upload_name(std::string(300, 'a'))).code,
              "invalid_upload_name");
}

}  // namespace
