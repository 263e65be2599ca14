// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <bucketdl/core/http_session.hpp>

using namespace bucketdl::core;

TEST_CASE("HttpSession::object_url", "[http]") {
    SECTION("Trailing slashes on the endpoint are dropped") {
        HttpSession session("https://data.example.org///");
        CHECK(session.endpoint() == "https://data.example.org");
        CHECK(session.object_url("2024/a.csv") == "https://data.example.org/2024/a.csv");
    }

    SECTION("Keys are percent-encoded except for slashes") {
        CHECK(HttpSession::escape_key("dir/a b+c.txt") == "dir/a%20b%2Bc.txt");
        CHECK(HttpSession::escape_key("~user/file-1_2.tar.gz") == "~user/file-1_2.tar.gz");
        CHECK(HttpSession::escape_key("caf\xC3\xA9") == "caf%C3%A9");
    }
}

TEST_CASE("HttpSession::status_to_error", "[http]") {
    CHECK_FALSE(HttpSession::status_to_error(200));
    CHECK_FALSE(HttpSession::status_to_error(206));
    CHECK(HttpSession::status_to_error(401) == DownloadErrc::authentication_failed);
    CHECK(HttpSession::status_to_error(403) == DownloadErrc::permission_denied);
    CHECK(HttpSession::status_to_error(404) == DownloadErrc::not_found);
    CHECK(HttpSession::status_to_error(410) == DownloadErrc::not_found);
    CHECK(HttpSession::status_to_error(416) == DownloadErrc::invalid_range);
    CHECK(HttpSession::status_to_error(429) == DownloadErrc::throttled);
    CHECK(HttpSession::status_to_error(503) == DownloadErrc::server_error);
    CHECK(HttpSession::status_to_error(400) == DownloadErrc::invalid_argument);
}
