
#include "stdinc.hpp"

#include "ddp/utils/unique-id.hpp"

#include <catch2/catch.hpp>

#include <cctype>
#include <set>

namespace ddp::test {

// ------------------------------------------------------------------- TEST_CASE
//
CATCH_TEST_CASE("unique-id", "[unique-id]") {
  //

  CATCH_SECTION("canonical-form") {
    const auto id = unique_id();
    CATCH_REQUIRE(id.size() == 36);
    for (auto i : {8, 13, 18, 23})
      CATCH_REQUIRE(id[std::size_t(i)] == '-');
    CATCH_REQUIRE(id[14] == '4'); // version 4
    CATCH_REQUIRE(std::all_of(cbegin(id), cend(id), [](char c) {
      return c == '-' || std::isxdigit(static_cast<unsigned char>(c));
    }));
  }

  CATCH_SECTION("pairwise-distinct") {
    std::set<std::string> ids;
    for (auto i = 0; i < 10000; ++i)
      ids.insert(unique_id());
    CATCH_REQUIRE(ids.size() == 10000);
  }

  CATCH_SECTION("threads") {
    std::vector<std::string> a, b;
    std::thread t1{[&]() {
      for (auto i = 0; i < 1000; ++i)
        a.push_back(unique_id());
    }};
    std::thread t2{[&]() {
      for (auto i = 0; i < 1000; ++i)
        b.push_back(unique_id());
    }};
    t1.join();
    t2.join();
    std::set<std::string> ids{a.begin(), a.end()};
    ids.insert(b.begin(), b.end());
    CATCH_REQUIRE(ids.size() == 2000);
  }
}

} // namespace ddp::test
