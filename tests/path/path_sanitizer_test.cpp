#include "sendme/path/sanitizer.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using sendme::ErrorKind;
using namespace sendme::path;

namespace {

const std::vector<std::string> kUnsafeNames = {
    "../x",
    "a/../b",
    "/abs",
    "a\\b",
    "a/b/../../../etc",
};

const std::vector<std::string> kSafeNames = {
    "a",
    "a/b",
    "a/b/c.txt",
};

} // namespace

TEST(PathSanitizerTest, SanitizeNameRejectsTraversalAndSeparators) {
    for (const auto& name : kUnsafeNames) {
        auto result = sanitize_name(name);
        ASSERT_TRUE(result.is_error()) << name;
        EXPECT_EQ(result.error().kind, ErrorKind::InvalidPath) << name;
    }
}

TEST(PathSanitizerTest, SanitizeNameAcceptsPlainRelativeNames) {
    for (const auto& name : kSafeNames) {
        auto result = sanitize_name(name);
        ASSERT_TRUE(result.is_ok()) << name << ": " << result.error().message;
        EXPECT_EQ(result.value(), name);
    }
}

TEST(PathSanitizerTest, CanonicalizedPathRejectsTheSameCases) {
    for (const auto& name : kUnsafeNames) {
        EXPECT_TRUE(canonicalized_path_to_string(fs::path(name), true).is_error()) << name;
    }
    for (const auto& name : kSafeNames) {
        auto result = canonicalized_path_to_string(fs::path(name), true);
        ASSERT_TRUE(result.is_ok()) << name;
        EXPECT_EQ(result.value(), name);
    }
}

TEST(PathSanitizerTest, AbsolutePathAllowedOnlyWhenRequested) {
    EXPECT_TRUE(canonicalized_path_to_string(fs::path("/srv/data"), true).is_error());

    auto result = canonicalized_path_to_string(fs::path("/srv/data"), false);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value(), "/srv/data");
}

TEST(PathSanitizerTest, ComponentValidation) {
    EXPECT_TRUE(validate_path_component("file.txt").is_ok());
    EXPECT_TRUE(validate_path_component("\xc3\xa9t\xc3\xa9").is_ok());  // "été"

    EXPECT_TRUE(validate_path_component("").is_error());
    EXPECT_TRUE(validate_path_component(".").is_error());
    EXPECT_TRUE(validate_path_component("..").is_error());
    EXPECT_TRUE(validate_path_component("a/b").is_error());
    EXPECT_TRUE(validate_path_component("a\\b").is_error());
    EXPECT_TRUE(validate_path_component(std::string("a\0b", 3)).is_error());
    EXPECT_TRUE(validate_path_component("\xff\xfe").is_error());
    EXPECT_TRUE(validate_path_component("\xc0\xaf").is_error());  // overlong '/'
    EXPECT_TRUE(validate_path_component("\xe2\x82").is_error());  // truncated
}

TEST(PathSanitizerTest, EntryNameExcludesImportRoot) {
    const fs::path root = "/data/photos";

    auto nested = entry_name(root, root / "2024" / "beach.jpg");
    ASSERT_TRUE(nested.is_ok());
    EXPECT_EQ(nested.value(), "2024/beach.jpg");

    EXPECT_TRUE(entry_name(root, "/data/other/file").is_error());
    EXPECT_TRUE(entry_name(root, root).is_error());
}

TEST(PathSanitizerTest, DestinationPathStaysUnderRoot) {
    const fs::path root = "/tmp/out";

    auto ok = destination_path(root, "dir/file.txt");
    ASSERT_TRUE(ok.is_ok());
    EXPECT_EQ(ok.value(), root / "dir" / "file.txt");

    for (const auto& name : kUnsafeNames) {
        auto result = destination_path(root, name);
        ASSERT_TRUE(result.is_error()) << name;
        EXPECT_EQ(result.error().kind, ErrorKind::InvalidPath);
    }
}
