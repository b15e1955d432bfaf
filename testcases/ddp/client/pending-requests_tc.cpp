
#include "stdinc.hpp"

#include "ddp/client/pending-requests.hpp"

#include <catch2/catch.hpp>

namespace ddp::test {

// ------------------------------------------------------------------- TEST_CASE
//
CATCH_TEST_CASE("pending-requests", "[pending-requests]") {
  //

  CATCH_SECTION("resolve-removes") {
    PendingRequests pending;
    int calls = 0;
    pending.insert("a", AwaitingResult{[&](const Status&, std::string_view) { ++calls; }});
    CATCH_REQUIRE(pending.size() == 1);
    CATCH_REQUIRE(pending.contains("a"));

    auto continuation = pending.resolve("a");
    CATCH_REQUIRE(continuation.has_value());
    CATCH_REQUIRE(!pending.contains("a"));
    CATCH_REQUIRE(!pending.resolve("a").has_value());

    std::get<AwaitingResult>(*continuation).handler(Status{}, "");
    CATCH_REQUIRE(calls == 1);
  }

  CATCH_SECTION("insert-overwrites") {
    PendingRequests pending;
    pending.insert("a", AwaitingReady{[](const Status&) {}});
    pending.insert("a", AwaitingUnsub{[]() {}});
    CATCH_REQUIRE(pending.size() == 1);
    auto continuation = pending.resolve("a");
    CATCH_REQUIRE(std::holds_alternative<AwaitingUnsub>(*continuation));
  }

  CATCH_SECTION("resolve-as-is-kind-aware") {
    PendingRequests pending;
    pending.insert("rpc", AwaitingResult{[](const Status&, std::string_view) {}});
    pending.insert("sub", AwaitingReady{[](const Status&) {}});

    // A `ready` naming a method id leaves the method waiting
    CATCH_REQUIRE(!pending.resolve_as<AwaitingReady>("rpc").has_value());
    CATCH_REQUIRE(pending.contains("rpc"));

    // A `result` naming a subscription id leaves the subscription waiting
    CATCH_REQUIRE(!pending.resolve_as<AwaitingResult>("sub").has_value());
    CATCH_REQUIRE(pending.contains("sub"));

    CATCH_REQUIRE(pending.resolve_as<AwaitingReady, AwaitingUnsub>("sub").has_value());
    CATCH_REQUIRE(pending.resolve_as<AwaitingResult>("rpc").has_value());
    CATCH_REQUIRE(pending.size() == 0);
  }

  CATCH_SECTION("clear-drops-without-invoking") {
    PendingRequests pending;
    int calls = 0;
    for (auto i = 0; i < 10; ++i)
      pending.insert(std::to_string(i), AwaitingReady{[&](const Status&) { ++calls; }});
    CATCH_REQUIRE(pending.clear() == 10);
    CATCH_REQUIRE(pending.size() == 0);
    CATCH_REQUIRE(calls == 0);
  }

  CATCH_SECTION("concurrent-resolve-hands-out-once") {
    PendingRequests pending;
    constexpr int k_n_ids = 1000;
    for (auto i = 0; i < k_n_ids; ++i)
      pending.insert(std::to_string(i), AwaitingUnsub{[]() {}});

    std::atomic<int> resolved{0};
    auto worker = [&]() {
      for (auto i = 0; i < k_n_ids; ++i)
        if (pending.resolve(std::to_string(i)))
          ++resolved;
    };
    std::thread t1{worker};
    std::thread t2{worker};
    t1.join();
    t2.join();
    CATCH_REQUIRE(resolved.load() == k_n_ids);
  }
}

} // namespace ddp::test
