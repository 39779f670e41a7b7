// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "verify/http_message.hpp"

#include <string>

using namespace proxyscan::verify;

namespace {

bool FeedAll(HttpResponseParser& parser, const std::string& data) {
    return parser.Feed(data.data(), data.size());
}

}  // namespace

TEST_CASE("ParseHttpUrl", "[verify][http]") {
    SECTION("Default geolocation service") {
        auto url = ParseHttpUrl("http://ip-api.com/json");
        REQUIRE(url);
        REQUIRE(url->host == "ip-api.com");
        REQUIRE(url->port == 80);
        REQUIRE(url->target == "/json");
        REQUIRE(url->ToString() == "http://ip-api.com/json");
    }

    SECTION("Port, query and missing path") {
        auto url = ParseHttpUrl("http://127.0.0.1:8080?fields=city");
        REQUIRE(url);
        REQUIRE(url->host == "127.0.0.1");
        REQUIRE(url->port == 8080);
        REQUIRE(url->target == "/?fields=city");
        REQUIRE(url->Authority() == "127.0.0.1:8080");

        auto bare = ParseHttpUrl("example.com");
        REQUIRE(bare);
        REQUIRE(bare->target == "/");
    }

    SECTION("Bracketed IPv6 host") {
        auto url = ParseHttpUrl("http://[2001:db8::1]:81/geo");
        REQUIRE(url);
        REQUIRE(url->host == "2001:db8::1");
        REQUIRE(url->port == 81);
        REQUIRE(url->Authority() == "[2001:db8::1]:81");
    }

    SECTION("Rejected forms") {
        REQUIRE_FALSE(ParseHttpUrl(""));
        REQUIRE_FALSE(ParseHttpUrl("https://ip-api.com/json"));
        REQUIRE_FALSE(ParseHttpUrl("ftp://example.com/"));
        REQUIRE_FALSE(ParseHttpUrl("http:///json"));
        REQUIRE_FALSE(ParseHttpUrl("http://host:/json"));
        REQUIRE_FALSE(ParseHttpUrl("http://host:0/json"));
        REQUIRE_FALSE(ParseHttpUrl("http://host:99999/json"));
        REQUIRE_FALSE(ParseHttpUrl("http://user:pw@host/json"));
        REQUIRE_FALSE(ParseHttpUrl("http://[::1/json"));
    }
}

TEST_CASE("BuildProxyGetRequest uses the absolute request target", "[verify][http]") {
    auto url = ParseHttpUrl("http://ip-api.com/json");
    REQUIRE(url);
    std::string request = BuildProxyGetRequest(*url, "proxyscan/0.4.0");

    REQUIRE(request.rfind("GET http://ip-api.com/json HTTP/1.1\r\n", 0) == 0);
    REQUIRE(request.find("\r\nHost: ip-api.com\r\n") != std::string::npos);
    REQUIRE(request.find("\r\nUser-Agent: proxyscan/0.4.0\r\n") != std::string::npos);
    REQUIRE(request.find("\r\nConnection: close\r\n") != std::string::npos);
    REQUIRE(request.size() >= 4);
    REQUIRE(request.substr(request.size() - 4) == "\r\n\r\n");
}

TEST_CASE("HttpResponseParser: Content-Length framing", "[verify][http]") {
    HttpResponseParser parser;
    const std::string response =
        "HTTP/1.1 200 OK\r\n"
        "Content-Type: application/json\r\n"
        "Content-Length: 20\r\n"
        "\r\n"
        "{\"status\":\"success\"}";

    SECTION("In one piece") {
        REQUIRE(FeedAll(parser, response));
    }

    SECTION("One byte at a time") {
        for (size_t i = 0; i < response.size(); ++i) {
            REQUIRE(parser.Feed(response.data() + i, 1));
            if (i + 1 < response.size()) {
                REQUIRE_FALSE(parser.complete());
            }
        }
    }

    REQUIRE(parser.complete());
    REQUIRE(parser.headers_complete());
    REQUIRE(parser.status_code() == 200);
    REQUIRE(parser.reason() == "OK");
    REQUIRE(parser.body() == "{\"status\":\"success\"}");
    REQUIRE(parser.header("content-type") == std::optional<std::string>("application/json"));
    REQUIRE(parser.header("CONTENT-LENGTH") == std::optional<std::string>("20"));
    REQUIRE_FALSE(parser.header("X-Missing"));
}

TEST_CASE("HttpResponseParser: repeated Content-Length headers", "[verify][http]") {
    HttpResponseParser parser;

    SECTION("Identical values are accepted") {
        REQUIRE(FeedAll(parser, "HTTP/1.1 200 OK\r\nContent-Length: 5\r\nContent-Length: 5\r\n\r\nhello"));
        REQUIRE(parser.complete());
        REQUIRE(parser.body() == "hello");
    }

    SECTION("A single header listing the same value twice") {
        REQUIRE(FeedAll(parser, "HTTP/1.1 200 OK\r\nContent-Length: 5 , 5\r\n\r\nhello"));
        REQUIRE(parser.complete());
        REQUIRE(parser.body() == "hello");
    }

    SECTION("Conflicting values are rejected") {
        REQUIRE_FALSE(FeedAll(parser, "HTTP/1.1 200 OK\r\nContent-Length: 5\r\nContent-Length: 6\r\n\r\nhello"));
        REQUIRE(parser.error() == "invalid Content-Length");
    }

    SECTION("An empty list entry is rejected") {
        REQUIRE_FALSE(FeedAll(parser, "HTTP/1.1 200 OK\r\nContent-Length: 5,\r\n\r\nhello"));
        REQUIRE(parser.error() == "invalid Content-Length");
    }
}

TEST_CASE("HttpResponseParser: chunked body", "[verify][http]") {
    HttpResponseParser parser;
    REQUIRE(FeedAll(parser,
                    "HTTP/1.1 200 OK\r\n"
                    "Transfer-Encoding: chunked\r\n"
                    "\r\n"
                    "5;ext=1\r\nhello\r\n"
                    "7\r\n, world\r\n"
                    "0\r\n"
                    "X-Trailer: ignored\r\n"
                    "\r\n"));
    REQUIRE(parser.complete());
    REQUIRE(parser.body() == "hello, world");
}

TEST_CASE("HttpResponseParser: body until connection close", "[verify][http]") {
    HttpResponseParser parser;
    REQUIRE(FeedAll(parser, "HTTP/1.0 200 OK\r\n\r\npartial"));
    REQUIRE(parser.headers_complete());
    REQUIRE_FALSE(parser.complete());
    REQUIRE(FeedAll(parser, " body"));
    REQUIRE(parser.FinishEof());
    REQUIRE(parser.body() == "partial body");
}

TEST_CASE("HttpResponseParser: EOF before the declared length is incomplete", "[verify][http]") {
    HttpResponseParser parser;
    REQUIRE(FeedAll(parser, "HTTP/1.1 200 OK\r\nContent-Length: 10\r\n\r\nabc"));
    REQUIRE_FALSE(parser.FinishEof());
    REQUIRE_FALSE(parser.failed());
}

TEST_CASE("HttpResponseParser: status handling", "[verify][http]") {
    SECTION("Interim 100 Continue is skipped") {
        HttpResponseParser parser;
        REQUIRE(FeedAll(parser, "HTTP/1.1 100 Continue\r\n\r\nHTTP/1.1 200 OK\r\nContent-Length: 2\r\n\r\nok"));
        REQUIRE(parser.complete());
        REQUIRE(parser.status_code() == 200);
        REQUIRE(parser.body() == "ok");
    }

    SECTION("204 has no body") {
        HttpResponseParser parser;
        REQUIRE(FeedAll(parser, "HTTP/1.1 204 No Content\r\n\r\n"));
        REQUIRE(parser.complete());
        REQUIRE(parser.body().empty());
    }

    SECTION("Error status with multi-word reason") {
        HttpResponseParser parser;
        REQUIRE(FeedAll(parser, "HTTP/1.1 407 Proxy Authentication Required\r\nContent-Length: 0\r\n\r\n"));
        REQUIRE(parser.complete());
        REQUIRE(parser.status_code() == 407);
        REQUIRE(parser.reason() == "Proxy Authentication Required");
    }

    SECTION("Missing reason phrase") {
        HttpResponseParser parser;
        REQUIRE(FeedAll(parser, "HTTP/1.1 200\r\nContent-Length: 0\r\n\r\n"));
        REQUIRE(parser.complete());
        REQUIRE(parser.reason().empty());
    }

    SECTION("Repeated headers are joined") {
        HttpResponseParser parser;
        REQUIRE(FeedAll(parser, "HTTP/1.1 200 OK\r\nVia: a\r\nvia: b\r\nContent-Length: 0\r\n\r\n"));
        REQUIRE(parser.header("Via") == std::optional<std::string>("a, b"));
    }
}

TEST_CASE("HttpResponseParser: malformed input", "[verify][http]") {
    HttpResponseParser parser;

    SECTION("Not HTTP") {
        REQUIRE_FALSE(FeedAll(parser, "SSH-2.0-OpenSSH_9.6\r\n"));
        REQUIRE(parser.error() == "invalid HTTP response");
    }

    SECTION("Bad status code") {
        REQUIRE_FALSE(FeedAll(parser, "HTTP/1.1 2x0 OK\r\n"));
        REQUIRE(parser.error() == "invalid HTTP response");
    }

    SECTION("Header without colon") {
        REQUIRE_FALSE(FeedAll(parser, "HTTP/1.1 200 OK\r\nbroken header\r\n"));
        REQUIRE(parser.error() == "invalid HTTP header");
    }

    SECTION("Bad Content-Length") {
        REQUIRE_FALSE(FeedAll(parser, "HTTP/1.1 200 OK\r\nContent-Length: -1\r\n\r\n"));
        REQUIRE(parser.error() == "invalid Content-Length");
    }

    SECTION("Oversized body") {
        REQUIRE_FALSE(FeedAll(parser, "HTTP/1.1 200 OK\r\nContent-Length: 2000000\r\n\r\n"));
        REQUIRE(parser.error() == "response body too large");
    }

    SECTION("Bad chunk size") {
        REQUIRE_FALSE(FeedAll(parser, "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\nzz\r\n"));
        REQUIRE(parser.error() == "invalid chunk size");
    }

    SECTION("Endless headers") {
        std::string flood = "HTTP/1.1 200 OK\r\n";
        while (flood.size() <= HttpResponseParser::MAX_HEADER_SIZE) {
            flood += "X-Filler: aaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaa\r\n";
        }
        REQUIRE_FALSE(FeedAll(parser, flood));
        REQUIRE(parser.error() == "response headers too large");
    }

    REQUIRE(parser.failed());
    // Further input is refused
    REQUIRE_FALSE(FeedAll(parser, "more"));
}
