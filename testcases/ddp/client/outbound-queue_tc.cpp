
#include "stdinc.hpp"

#include "ddp/client/outbound-queue.hpp"

#include <catch2/catch.hpp>

namespace ddp::test {

// ------------------------------------------------------------------- TEST_CASE
//
CATCH_TEST_CASE("outbound-queue", "[outbound-queue]") {
  //

  CATCH_SECTION("fifo") {
    OutboundQueue queue;
    CATCH_REQUIRE(queue.empty());
    queue.push("one");
    queue.push("two");
    queue.push("three");
    CATCH_REQUIRE(queue.size() == 3);

    const auto frames = queue.drain();
    CATCH_REQUIRE(frames == std::deque<std::string>{"one", "two", "three"});
    CATCH_REQUIRE(queue.empty());
    CATCH_REQUIRE(queue.drain().empty());
  }

  CATCH_SECTION("drain-is-a-snapshot") {
    OutboundQueue queue;
    queue.push("one");
    auto frames = queue.drain();
    queue.push("two");
    CATCH_REQUIRE(frames.size() == 1);
    CATCH_REQUIRE(queue.size() == 1);
    CATCH_REQUIRE(queue.clear() == 1);
    CATCH_REQUIRE(queue.empty());
  }

  CATCH_SECTION("concurrent-push-and-drain") {
    OutboundQueue queue;
    constexpr int k_n_frames = 2000;
    std::vector<std::string> drained;

    std::thread producer{[&]() {
      for (auto i = 0; i < k_n_frames; ++i)
        queue.push(std::to_string(i));
    }};
    while (drained.size() < std::size_t(k_n_frames)) {
      for (auto& frame : queue.drain())
        drained.push_back(std::move(frame));
    }
    producer.join();

    // Each frame exactly once, in order
    for (auto i = 0; i < k_n_frames; ++i)
      CATCH_REQUIRE(drained[std::size_t(i)] == std::to_string(i));
  }
}

} // namespace ddp::test
