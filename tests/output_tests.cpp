// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <bucketdl/cli/output.hpp>
#include <bucketdl/cli/progress_bar.hpp>
#include <nlohmann/json.hpp>

using namespace bucketdl::cli;
using namespace bucketdl::core;
using json = nlohmann::json;

TEST_CASE("format_size", "[output]") {
    CHECK(format_size(0) == "0.0 B");
    CHECK(format_size(512) == "512.0 B");
    CHECK(format_size(1536) == "1.5 KB");
    CHECK(format_size(10.0 * 1024 * 1024) == "10.0 MB");
    CHECK(format_size(2.5 * 1024 * 1024 * 1024) == "2.5 GB");
    CHECK(format_size(3.0 * 1024 * 1024 * 1024 * 1024 * 1024) == "3.0 PB");
}

TEST_CASE("format_duration", "[output]") {
    CHECK(format_duration(4.3) == "4.3s");
    CHECK(format_duration(59.9) == "59.9s");
    CHECK(format_duration(187) == "3m 7s");
    CHECK(format_duration(7500) == "2h 5m");
}

TEST_CASE("format_summary", "[output]") {
    Summary summary;
    summary.total_objects = 3;
    summary.completed = 2;
    summary.failed = 1;
    summary.bytes_transferred = 3072;
    summary.duration = std::chrono::milliseconds(1234);
    summary.failures.push_back({"c.bin", DownloadErrc::not_found, "Object not found (404)"});

    std::vector<DownloadedFile> files{{"a.bin", 1024, "abc"}, {"b.bin", 2048, "def"}};

    SECTION("JSON document") {
        auto doc = json::parse(format_summary(summary, files, true));
        CHECK(doc["status"] == "error");
        CHECK(doc["code"] == "PARTIAL_FAILURE");
        CHECK(doc["files"].size() == 2);
        CHECK(doc["files"][0]["path"] == "a.bin");
        CHECK(doc["files"][1]["checksum"] == "def");
        CHECK(doc["total_bytes"] == 3072);
        CHECK(doc["elapsed_seconds"] == 1.23);
        CHECK(doc["summary"]["downloaded"] == 2);
        CHECK(doc["summary"]["failed"] == 1);
        CHECK(doc["failures"][0]["path"] == "c.bin");
        CHECK(doc["cancelled"] == false);
        CHECK_FALSE(doc.contains("abort_reason"));
    }

    SECTION("Successful JSON run") {
        summary.failed = 0;
        summary.failures.clear();
        auto doc = json::parse(format_summary(summary, files, true));
        CHECK(doc["status"] == "success");
        CHECK(doc["code"] == "SUCCESS");
        CHECK(doc["failures"].empty());
    }

    SECTION("Human text") {
        auto text = format_summary(summary, files, false);
        CHECK_THAT(text, Catch::Matchers::ContainsSubstring("Download complete:"));
        CHECK_THAT(text, Catch::Matchers::ContainsSubstring("2 downloaded, 0 skipped, 1 failed"));
        CHECK_THAT(text, Catch::Matchers::ContainsSubstring("Size:  3.0 KB"));
        CHECK_THAT(text, Catch::Matchers::ContainsSubstring("Time:  1.2s"));
        CHECK_THAT(text, Catch::Matchers::ContainsSubstring("failed: c.bin (Object not found (404))"));
    }

    SECTION("Cancelled run") {
        summary.cancelled = true;
        summary.pending = 1;
        auto text = format_summary(summary, files, false);
        CHECK_THAT(text, Catch::Matchers::StartsWith("\nDownload cancelled:"));
        CHECK_THAT(text, Catch::Matchers::ContainsSubstring("1 pending"));
        CHECK(json::parse(format_summary(summary, files, true))["code"] == "CANCELLED");
    }

    SECTION("Dry run") {
        Summary plan;
        plan.dry_run = true;
        plan.total_objects = 2;
        plan.pending = 1;
        plan.skipped = 1;
        plan.planned = {"x.bin"};

        auto doc = json::parse(format_summary(plan, {}, true));
        CHECK(doc["dry_run"] == true);
        CHECK(doc["planned"] == json::array({"x.bin"}));
        CHECK_FALSE(doc.contains("files"));

        auto text = format_summary(plan, {}, false);
        CHECK_THAT(text, Catch::Matchers::ContainsSubstring("would download: x.bin"));
        CHECK_THAT(text, Catch::Matchers::ContainsSubstring("1 to download, 1 already complete"));
    }
}

TEST_CASE("outcome_code", "[output]") {
    CHECK(outcome_code(RunOutcome::auth_failure) == "AUTH_FAILED");
    CHECK(outcome_code(RunOutcome::network_error) == "NETWORK_ERROR");
    CHECK(outcome_code(RunOutcome::not_found) == "NOT_FOUND");
}

TEST_CASE("format_error", "[output]") {
    CHECK(format_error("NOT_FOUND", "No files", false) == "Error: No files");

    auto doc = json::parse(format_error("AUTH_FAILED", "bad token", true));
    CHECK(doc["status"] == "error");
    CHECK(doc["code"] == "AUTH_FAILED");
    CHECK(doc["message"] == "bad token");
}

TEST_CASE("format_list", "[output]") {
    DirectoryContents contents{{"2023", "2024"}, {"readme.txt"}};

    SECTION("Text") {
        auto text = format_list(contents, {2048}, "data/", false);
        CHECK(text == "Folders:\n  2023/\n  2024/\nFiles:\n  readme.txt"
                      + std::string(30, ' ') + " " + "    2.0 KB");
    }

    SECTION("Empty") {
        CHECK(format_list({}, {}, "", false) == "(empty)");
    }

    SECTION("JSON") {
        auto doc = json::parse(format_list(contents, {2048}, "data/", true));
        CHECK(doc["prefix"] == "data/");
        CHECK(doc["folders"].size() == 2);
        CHECK(doc["files"][0]["name"] == "readme.txt");
        CHECK(doc["files"][0]["size"] == 2048);
    }
}

TEST_CASE("ProgressBar::render", "[output]") {
    ProgressBar bar(1000, 4);

    SECTION("Half way") {
        auto line = bar.render(500, 2, 0);
        CHECK_THAT(line, Catch::Matchers::StartsWith("Files 2/4 [==============="));
        CHECK_THAT(line, Catch::Matchers::ContainsSubstring(" 50% (500.0 B/1000.0 B)"));
        CHECK_THAT(line, !Catch::Matchers::ContainsSubstring("ETA"));
    }

    SECTION("Speed and ETA") {
        auto line = bar.render(500, 2, 100);
        CHECK_THAT(line, Catch::Matchers::EndsWith("@ 100.0 B/s ETA: 5.0s"));
    }

    SECTION("Empty total shows complete") {
        ProgressBar empty(0, 0);
        CHECK_THAT(empty.render(0, 0, 0), Catch::Matchers::ContainsSubstring("100%"));
    }
}
