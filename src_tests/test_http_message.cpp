/**
 * @file test_http_message.cpp
 * @brief Tests for the HTTP/1.1 request parser and response serialiser used by the proxy
 *
 * Covers:
 *  - Request line, headers, query split and case-insensitive lookup
 *  - Content-Length and chunked body framing
 *  - Malformed input classified as HttpRequestInvalid
 *  - Response serialisation with recomputed Content-Length
 */

#include <catch2/catch.hpp>

#include <string>

#include "grader_harness/error_codes.hpp"
#include "grader_harness/http_message.hpp"

using grader::harness::ErrorCode;
using grader::harness::NetworkError;

namespace http = grader::harness::http;

namespace {

ErrorCode parse_error(const std::string& head) {
    try {
        (void)http::parse_request_head(head);
    } catch (const NetworkError& ex) {
        return ex.code();
    }
    return ErrorCode::None;
}

}  // namespace

TEST_CASE("Request head is parsed into method, target and headers", "[http][parse]") {
    const auto request = http::parse_request_head(
        "get /books/1?lang=en&q=dune%20messiah HTTP/1.1\r\n"
        "Host: localhost:5000\r\n"
        "content-type:  application/json \r\n"
        "Content-Length: 12\r\n"
        "\r\n");

    REQUIRE(request.method == "GET");
    REQUIRE(request.target == "/books/1?lang=en&q=dune%20messiah");
    REQUIRE(request.path == "/books/1");
    REQUIRE(request.query == "lang=en&q=dune%20messiah");
    REQUIRE(request.protocol == "HTTP/1.1");
    REQUIRE(request.header("Content-Type") == "application/json");
    REQUIRE(request.has_header("HOST"));
    REQUIRE_FALSE(request.has_header("Accept"));
    REQUIRE(http::content_length(request) == 12);
    REQUIRE_FALSE(http::is_chunked(request));

    const auto params = http::parse_query_string(request.query);
    REQUIRE(params.at("lang") == "en");
    REQUIRE(params.at("q") == "dune messiah");
}

TEST_CASE("Malformed heads are rejected", "[http][parse][invalid]") {
    REQUIRE(parse_error("GET /only-two-parts\r\n\r\n") == ErrorCode::HttpRequestInvalid);
    REQUIRE(parse_error("GET / SPDY/3\r\n\r\n") == ErrorCode::HttpRequestInvalid);
    REQUIRE(parse_error("GET / HTTP/1.1\r\nNoColonHere\r\n\r\n") == ErrorCode::HttpRequestInvalid);

    const auto request = http::parse_request_head("POST / HTTP/1.1\r\nContent-Length: lots\r\n\r\n");
    REQUIRE_THROWS_AS(http::content_length(request), NetworkError);
}

TEST_CASE("Chunked bodies decode once complete", "[http][chunked]") {
    const auto request = http::parse_request_head("POST /books HTTP/1.1\r\nTransfer-Encoding: chunked\r\n\r\n");
    REQUIRE(http::is_chunked(request));

    REQUIRE(http::decode_chunked("4\r\nWiki\r\n5;ext=1\r\npedia\r\n0\r\n\r\n") ==
            std::optional<std::string>{"Wikipedia"});
    REQUIRE_FALSE(http::decode_chunked("4\r\nWiki\r\n").has_value());
    REQUIRE_FALSE(http::decode_chunked("4\r\nWi").has_value());
    REQUIRE_THROWS_AS(http::decode_chunked("zz\r\nWiki\r\n0\r\n\r\n"), NetworkError);
    REQUIRE_THROWS_AS(http::decode_chunked("4\r\nWikiXX0\r\n\r\n"), NetworkError);
}

TEST_CASE("Oversized chunk sizes are rejected", "[http][chunked][limits]") {
    REQUIRE_THROWS_AS(http::decode_chunked("FFFFFFFFFFFFFFEC\r\nABCDEFGH"), NetworkError);
    REQUIRE_THROWS_AS(http::decode_chunked("0000000000000004\r\nWiki\r\n0\r\n\r\n"), NetworkError);
    // Fifteen digits parse; the body is simply incomplete.
    REQUIRE_FALSE(http::decode_chunked("FFFFFFFFFFFFFFF\r\nABCDEFGH").has_value());
}

TEST_CASE("Responses serialise with a recomputed length", "[http][response]") {
    http::HttpResponse response;
    response.status_code = 201;
    response.status_message = "";
    response.set_content_type("application/json");
    response.set_header("content-type", "application/json; charset=utf-8");
    response.set_header("Content-Length", "999");
    response.body = R"({"id":7})";

    const auto wire = http::build_response(response);
    REQUIRE(wire.rfind("HTTP/1.1 201 Created\r\n", 0) == 0);
    REQUIRE(wire.find("content-type: application/json; charset=utf-8\r\n") != std::string::npos);
    REQUIRE(wire.find("Content-Type: application/json\r\n") == std::string::npos);
    REQUIRE(wire.find("Content-Length: 8\r\n") != std::string::npos);
    REQUIRE(wire.find("999") == std::string::npos);
    REQUIRE(wire.find("Connection: close\r\n\r\n{\"id\":7}") != std::string::npos);
}

TEST_CASE("Error responses carry a plain-text message", "[http][response][error]") {
    const auto response = http::build_error_response(502, "Proxy request failed: connection refused");
    REQUIRE(response.status_code == 502);
    REQUIRE(response.status_message == "Bad Gateway");
    REQUIRE(response.header("content-type") == "text/plain; charset=utf-8");
    REQUIRE(response.body == "Proxy request failed: connection refused");
    REQUIRE(http::status_message(418) == "Unknown");
}
