#include <catch2/catch_test_macros.hpp>

#include "mcplink/transport/http_client.hpp"
#include "mcplink/transport/http_types.hpp"

using namespace mcplink;

TEST_CASE("Header lookups ignore case", "[http][headers]") {
    HeaderMap headers{{"content-type", "text/event-stream; charset=utf-8"}};

    REQUIRE(get_header(headers, "Content-Type") == std::optional<std::string>{"text/event-stream; charset=utf-8"});
    REQUIRE(get_header(headers, "Accept").has_value() == false);

    set_header(headers, "CONTENT-TYPE", "application/json");
    REQUIRE(headers.size() == 1);
    REQUIRE(get_header(headers, "content-type") == std::optional<std::string>{"application/json"});
}

TEST_CASE("HttpResponseHead inspects the content type", "[http][headers]") {
    HttpResponseHead sse{200, {{"Content-Type", "text/event-stream"}}};
    REQUIRE(sse.is_success());
    REQUIRE(sse.is_sse());
    REQUIRE_FALSE(sse.is_json());

    HttpResponseHead json{202, {{"content-type", "application/json; charset=utf-8"}}};
    REQUIRE(json.is_json());

    HttpResponseHead empty{405, {}};
    REQUIRE_FALSE(empty.is_success());
    REQUIRE_FALSE(empty.is_sse());
    REQUIRE_FALSE(empty.is_json());
}

TEST_CASE("HttpRequest builders replace headers", "[http][request]") {
    HttpRequest request;
    request.with_header("Accept", "text/event-stream")
           .with_header("accept", "application/json")
           .with_body("{}");

    REQUIRE(request.headers.size() == 1);
    REQUIRE(get_header(request.headers, "Accept") == std::optional<std::string>{"application/json"});
    REQUIRE(request.body == std::optional<std::string>{"{}"});
    REQUIRE(to_string(HttpMethod::Post) == "POST");
}

TEST_CASE("parse_url accepts only http(s) URLs", "[http][url]") {
    auto url = parse_url("https://mcp.example.com/v1/mcp?tenant=a");
    REQUIRE(url.has_value());
    REQUIRE(url->scheme == "https");
    REQUIRE(url->host == "mcp.example.com");
    REQUIRE(url->port == 443);
    REQUIRE(url->path_with_query() == "/v1/mcp?tenant=a");
    REQUIRE(url->is_secure());

    auto local = parse_url("http://localhost:8080");
    REQUIRE(local.has_value());
    REQUIRE(local->port == 8080);
    REQUIRE(local->path == "/");

    REQUIRE(parse_url("ftp://example.com/file").has_value() == false);
    REQUIRE(parse_url("not a url").has_value() == false);
    REQUIRE(parse_url("").has_value() == false);
}

TEST_CASE("resolve_url resolves endpoints against the server URL", "[http][url]") {
    const std::string base = "http://localhost:8080/sse";

    REQUIRE(resolve_url(base, "/msg?sessionId=abc123") == std::optional<std::string>{"http://localhost:8080/msg?sessionId=abc123"});
    REQUIRE(resolve_url(base, "messages") == std::optional<std::string>{"http://localhost:8080/messages"});
    REQUIRE(resolve_url(base, "https://other.example.com/m") == std::optional<std::string>{"https://other.example.com/m"});
    REQUIRE(resolve_url(base, "javascript:alert(1)").has_value() == false);
    REQUIRE(resolve_url("nope", "/msg").has_value() == false);
}
