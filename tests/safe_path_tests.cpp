// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <bucketdl/disk/safe_path.hpp>
#include "test_helpers.hpp"

using namespace bucketdl::disk;
using bucketdl::test::TempDir;

namespace fs = std::filesystem;

TEST_CASE("safe_join keeps keys inside the root", "[safe_path]") {
    TempDir root;

    SECTION("Nested key") {
        auto p = safe_join(root.path(), "2024/06/data.csv");
        REQUIRE(p.has_value());
        CHECK(*p == root.path() / "2024" / "06" / "data.csv");
    }

    SECTION("Dot-dot that stays inside") {
        auto p = safe_join(root.path(), "a/b/../c.txt");
        REQUIRE(p.has_value());
        CHECK(*p == root.path() / "a" / "c.txt");
    }

    SECTION("Trailing slash on the root") {
        auto p = safe_join(root.path().string() + "/", "file.bin");
        REQUIRE(p.has_value());
        CHECK(*p == root.path() / "file.bin");
    }
}

TEST_CASE("safe_join rejects escapes", "[safe_path]") {
    TempDir root;
    const auto traversal = make_error_code(DiskErrc::path_traversal);

    SECTION("Parent traversal") {
        auto p = safe_join(root.path(), "a/../../etc/passwd");
        REQUIRE_FALSE(p.has_value());
        CHECK(p.error() == traversal);
    }

    SECTION("Absolute key") {
        auto p = safe_join(root.path(), "/etc/passwd");
        REQUIRE_FALSE(p.has_value());
        CHECK(p.error() == traversal);
    }

    SECTION("Leading dot") {
        CHECK_FALSE(safe_join(root.path(), "../x").has_value());
        CHECK_FALSE(safe_join(root.path(), ".hidden").has_value());
    }

    SECTION("Empty or blank") {
        CHECK_FALSE(safe_join(root.path(), "").has_value());
        CHECK_FALSE(safe_join(root.path(), "   ").has_value());
    }

    SECTION("Resolves to the root itself") {
        CHECK_FALSE(safe_join(root.path(), "a/..").has_value());
    }

    SECTION("Symlink pointing outside") {
        TempDir outside;
        std::error_code ec;
        fs::create_directory_symlink(outside.path(), root / "link", ec);
        REQUIRE_FALSE(ec);

        auto p = safe_join(root.path(), "link/file.txt");
        REQUIRE_FALSE(p.has_value());
        CHECK(p.error() == traversal);
    }
}

TEST_CASE("relative_key", "[safe_path]") {
    SECTION("Strips the prefix") {
        CHECK(relative_key("data/2024/a.csv", "data/") == "2024/a.csv");
    }

    SECTION("Strips leading slashes left behind") {
        CHECK(relative_key("data//a.csv", "data") == "a.csv");
    }

    SECTION("No prefix keeps the key") {
        CHECK(relative_key("data/a.csv", "") == "data/a.csv");
    }

    SECTION("Unrelated prefix keeps the key") {
        CHECK(relative_key("other/a.csv", "data/") == "other/a.csv");
    }

    SECTION("Key equal to the prefix falls back to its last segment") {
        CHECK(relative_key("data/a.csv", "data/a.csv") == "a.csv");
    }
}
