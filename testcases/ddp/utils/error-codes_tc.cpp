
#include "stdinc.hpp"

#include "ddp/utils/error-codes.hpp"

#include <catch2/catch.hpp>

namespace ddp::test {

// ------------------------------------------------------------------- TEST_CASE
//
CATCH_TEST_CASE("error-codes", "[error-codes]") {
  //

  CATCH_SECTION("category") {
    const std::error_code ec = ecode::malformed_frame;
    CATCH_REQUIRE(ec);
    CATCH_REQUIRE(&ec.category() == &ddp_category());
    CATCH_REQUIRE(std::string{ec.category().name()} == "ddp");
    CATCH_REQUIRE(ec.message() == "malformed frame");
    CATCH_REQUIRE(ec == make_error_code(ecode::malformed_frame));
    CATCH_REQUIRE(ec != make_error_code(ecode::invalid_url));
  }

  CATCH_SECTION("okay-is-falsy") { CATCH_REQUIRE(!make_error_code(ecode::okay)); }

  CATCH_SECTION("every-code-has-a-message") {
    for (auto e = int(ecode::okay); e <= int(ecode::reconnect_exhausted); ++e)
      CATCH_REQUIRE(make_error_code(static_cast<ecode>(e)).message() != "(unknown error)");
  }
}

} // namespace ddp::test
