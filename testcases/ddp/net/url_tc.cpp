
#include "stdinc.hpp"

#include "ddp/net/url.hpp"
#include "ddp/utils/error-codes.hpp"

#include <catch2/catch.hpp>

namespace ddp::net::test {

// ------------------------------------------------------------------- TEST_CASE
//
CATCH_TEST_CASE("websocket-url", "[url]") {
  //

  CATCH_SECTION("defaults") {
    const auto plain = parse_websocket_url("ws://localhost");
    CATCH_REQUIRE(plain.has_value());
    CATCH_REQUIRE(!plain->is_secure);
    CATCH_REQUIRE(plain->host == "localhost");
    CATCH_REQUIRE(plain->port == 80);
    CATCH_REQUIRE(plain->target == "/");

    const auto secure = parse_websocket_url("wss://example.meteor.com/websocket");
    CATCH_REQUIRE(secure.has_value());
    CATCH_REQUIRE(secure->is_secure);
    CATCH_REQUIRE(secure->host == "example.meteor.com");
    CATCH_REQUIRE(secure->port == 443);
    CATCH_REQUIRE(secure->target == "/websocket");
  }

  CATCH_SECTION("ports") {
    const auto url = parse_websocket_url("ws://127.0.0.1:3000/websocket?x=1");
    CATCH_REQUIRE(url.has_value());
    CATCH_REQUIRE(url->host == "127.0.0.1");
    CATCH_REQUIRE(url->port == 3000);
    CATCH_REQUIRE(url->target == "/websocket?x=1");

    const auto ipv6 = parse_websocket_url("wss://[::1]:8443/websocket");
    CATCH_REQUIRE(ipv6.has_value());
    CATCH_REQUIRE(ipv6->host == "::1");
    CATCH_REQUIRE(ipv6->port == 8443);

    const auto ipv6_default = parse_websocket_url("ws://[fe80::1]");
    CATCH_REQUIRE(ipv6_default.has_value());
    CATCH_REQUIRE(ipv6_default->host == "fe80::1");
    CATCH_REQUIRE(ipv6_default->port == 80);
  }

  CATCH_SECTION("invalid") {
    for (const auto url : {"", "http://localhost", "ws://", "ws://:80", "ws://host:0",
                           "ws://host:99999", "ws://host:12x", "ws://[::1", "ws://[::1]x"}) {
      const auto parsed = parse_websocket_url(url);
      CATCH_REQUIRE(!parsed.has_value());
      CATCH_REQUIRE(parsed.error() == ecode::invalid_url);
    }
  }
}

} // namespace ddp::net::test
