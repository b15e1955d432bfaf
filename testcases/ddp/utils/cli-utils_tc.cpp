
#include "stdinc.hpp"

#include "ddp/utils/cli-utils.hpp"

#include <catch2/catch.hpp>

namespace ddp::cli::test {

namespace {
struct Args {
  std::vector<std::string> args;
  std::vector<char*> argv;

  explicit Args(std::initializer_list<std::string> list) : args{list} {
    for (auto& arg : args)
      argv.push_back(arg.data());
  }
  int argc() const { return int(argv.size()); }
};
} // namespace

// ------------------------------------------------------------------- TEST_CASE
//
CATCH_TEST_CASE("cli-utils", "[cli-utils]") {
  //

  CATCH_SECTION("str-and-int") {
    Args args{"exec-name", "1", "two", "three"};
    int i = 0;
    CATCH_REQUIRE(safe_arg_int(args.argc(), args.argv.data(), i) == 1);
    CATCH_REQUIRE(i == 1);
    CATCH_REQUIRE(safe_arg_str(args.argc(), args.argv.data(), i) == "two");
    CATCH_REQUIRE(i == 2);
    CATCH_REQUIRE(safe_arg_str(args.argc(), args.argv.data(), i) == "three");
    CATCH_REQUIRE(i == 3);
  }

  CATCH_SECTION("missing-or-bad") {
    Args args{"exec-name", "--seconds", "ten"};
    int i = 1;
    CATCH_REQUIRE_THROWS_AS(safe_arg_int(args.argc(), args.argv.data(), i), std::runtime_error);
    CATCH_REQUIRE_THROWS_AS(safe_arg_str(args.argc(), args.argv.data(), i), std::runtime_error);
  }

  CATCH_SECTION("choice") {
    constexpr std::array<std::string_view, 3> k_choices = {"1", "pre2", "pre1"};
    Args args{"exec-name", "--version", "pre2", "--version", "v99"};
    int i = 1;
    CATCH_REQUIRE(safe_arg_choice(args.argc(), args.argv.data(), i, k_choices) == "pre2");
    CATCH_REQUIRE(i == 2);
    ++i;
    CATCH_REQUIRE_THROWS_AS(safe_arg_choice(args.argc(), args.argv.data(), i, k_choices),
                            std::runtime_error);
  }
}

} // namespace ddp::cli::test
