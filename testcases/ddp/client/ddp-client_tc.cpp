
#include "stdinc.hpp"

#include "ddp/client/ddp-client.hpp"

#include "../mock-transport.hpp"

#include <catch2/catch.hpp>

namespace ddp::test {

namespace {
constexpr std::string_view k_url = "ws://localhost:3000/websocket";

struct RecordingListener final : public DdpListener {
  int connects{0};
  std::vector<std::pair<uint16_t, std::string>> disconnects;
  std::vector<std::error_code> exceptions;
  std::vector<std::string> data; //!< One line per data callback

  void on_connect() override { ++connects; }
  void on_disconnect(uint16_t code, std::string_view reason) override {
    disconnects.emplace_back(code, std::string{reason});
  }
  void on_exception(std::error_code ec, std::string_view) override { exceptions.push_back(ec); }
  void on_data_added(std::string_view collection, std::string_view id,
                     std::string_view fields) override {
    data.push_back(format("added {} {} {}", collection, id, fields));
  }
  void on_data_changed(std::string_view collection, std::string_view id, std::string_view fields,
                       std::string_view cleared) override {
    data.push_back(format("changed {} {} {} {}", collection, id, fields, cleared));
  }
  void on_data_removed(std::string_view collection, std::string_view id) override {
    data.push_back(format("removed {} {}", collection, id));
  }

  bool saw(ecode e) const {
    return std::find(cbegin(exceptions), cend(exceptions), make_error_code(e)) != cend(exceptions);
  }
};

struct Harness {
  shared_ptr<RecordingListener> listener = make_shared<RecordingListener>();
  MockTransport* transport = nullptr; //!< Owned by `client`
  unique_ptr<DdpClient> client;

  explicit Harness(std::string version = "1") {
    auto mock = make_unique<MockTransport>();
    transport = mock.get();
    client = make_unique<DdpClient>(DdpClient::Config{string{k_url}, std::move(version)},
                                    std::move(mock), listener);
  }
};

Json::Value array_of(std::initializer_list<Json::Value> elements) {
  Json::Value array{Json::arrayValue};
  for (const auto& element : elements)
    array.append(element);
  return array;
}
} // namespace

// ------------------------------------------------------------------- TEST_CASE
//
CATCH_TEST_CASE("ddp-client-session", "[ddp-client]") {
  //

  CATCH_SECTION("construction-connects") {
    Harness h;
    CATCH_REQUIRE(h.transport->connects == std::vector<std::string>{string{k_url}});
    CATCH_REQUIRE(h.client->state() == ConnectionState::CONNECTING);
    CATCH_REQUIRE(!h.client->is_connected());
    CATCH_REQUIRE(h.client->protocol_version() == "1");
    CATCH_REQUIRE(h.transport->sent.empty());
  }

  CATCH_SECTION("unsupported-version-throws") {
    CATCH_REQUIRE_THROWS_AS(Harness{"v99"}, std::invalid_argument);
    CATCH_REQUIRE(DdpClient::is_version_supported("pre2"));
    CATCH_REQUIRE(!DdpClient::is_version_supported("2"));
    CATCH_REQUIRE(DdpClient::supported_versions().size() == 3);
    CATCH_REQUIRE(DdpClient::supported_versions().front() == "1");
  }

  CATCH_SECTION("handshake") {
    Harness h{"pre2"};
    h.transport->emit_open();
    CATCH_REQUIRE(h.client->state() == ConnectionState::AWAITING_HANDSHAKE);
    CATCH_REQUIRE(h.transport->sent.size() == 1);

    const auto connect = h.transport->sent_frame(0);
    CATCH_REQUIRE(connect["msg"].asString() == "connect");
    CATCH_REQUIRE(connect["version"].asString() == "pre2");
    CATCH_REQUIRE(connect["support"] == array_of({"1", "pre2", "pre1"}));
    CATCH_REQUIRE(!connect.isMember("session"));

    h.transport->emit_message(R"({"msg":"connected","session":"s1"})");
    CATCH_REQUIRE(h.client->is_connected());
    CATCH_REQUIRE(h.client->session_id() == "s1");
    CATCH_REQUIRE(h.listener->connects == 1);
  }

  CATCH_SECTION("first-connect-failure-is-reported-once") {
    Harness h;
    h.transport->emit_close(1006, "refused");
    CATCH_REQUIRE(h.transport->connects.size() == 1);
    CATCH_REQUIRE(h.client->state() == ConnectionState::DISCONNECTED);
    CATCH_REQUIRE(h.listener->disconnects.size() == 1);
    CATCH_REQUIRE(h.listener->disconnects[0].first == 1006);
    CATCH_REQUIRE(h.listener->disconnects[0].second == "refused");
    CATCH_REQUIRE(h.listener->saw(ecode::transport_error));

    h.client->reconnect();
    CATCH_REQUIRE(h.transport->connects.size() == 2);
  }

  CATCH_SECTION("reconnect-while-open-resends-handshake") {
    Harness h;
    h.transport->emit_connected("s1");
    h.client->reconnect();
    CATCH_REQUIRE(h.transport->connects.size() == 1);
    CATCH_REQUIRE(h.client->state() == ConnectionState::AWAITING_HANDSHAKE);
    const auto connect = h.transport->last_frame();
    CATCH_REQUIRE(connect["msg"].asString() == "connect");
    CATCH_REQUIRE(connect["session"].asString() == "s1");
  }

  CATCH_SECTION("explicit-disconnect") {
    Harness h;
    h.transport->emit_connected("s1");
    h.client->subscribe("todos", Json::Value{}, [](const Status&) {});
    h.client->disconnect();

    CATCH_REQUIRE(h.client->state() == ConnectionState::DISCONNECTED);
    CATCH_REQUIRE(!h.client->session_id());
    CATCH_REQUIRE(h.client->pending_count() == 0);
    CATCH_REQUIRE(h.transport->disconnects == 1);
    CATCH_REQUIRE(!h.transport->has_listener());
    CATCH_REQUIRE(h.listener->disconnects.empty());

    // Frames queued while disconnected are dropped by the next disconnect
    h.client->call("lost");
    CATCH_REQUIRE(h.client->queued_count() == 1);
    h.client->disconnect();
    CATCH_REQUIRE(h.client->queued_count() == 0);

    // Callbacks are detached, so a manual reconnect is silent
    const auto sent_before = h.transport->sent.size();
    h.client->reconnect();
    CATCH_REQUIRE(h.transport->connects.size() == 2);
    h.transport->emit_connected("s2");
    CATCH_REQUIRE(h.client->is_connected());
    CATCH_REQUIRE(h.listener->connects == 1);
    CATCH_REQUIRE(h.transport->sent.size() == sent_before + 1); // Just the handshake
  }
}

CATCH_TEST_CASE("ddp-client-outbound", "[ddp-client]") {
  //

  CATCH_SECTION("queue-until-connected") {
    Harness h;
    h.client->call("first");
    h.client->subscribe("second");
    h.transport->emit_open();
    h.client->call("third"); // Still waiting on the handshake
    CATCH_REQUIRE(h.transport->sent.size() == 1);
    CATCH_REQUIRE(h.client->queued_count() == 3);

    h.transport->emit_message(R"({"msg":"connected","session":"s1"})");
    CATCH_REQUIRE(h.client->queued_count() == 0);
    CATCH_REQUIRE(h.transport->sent.size() == 4);
    CATCH_REQUIRE(h.transport->sent_frame(1)["method"].asString() == "first");
    CATCH_REQUIRE(h.transport->sent_frame(2)["name"].asString() == "second");
    CATCH_REQUIRE(h.transport->sent_frame(3)["method"].asString() == "third");

    // Once connected frames go straight out, and nothing is sent twice
    h.client->call("fourth");
    CATCH_REQUIRE(h.transport->sent.size() == 5);
    CATCH_REQUIRE(h.transport->last_frame()["method"].asString() == "fourth");
    CATCH_REQUIRE(h.client->queued_count() == 0);
  }

  CATCH_SECTION("method-frames") {
    Harness h;
    h.transport->emit_connected();

    h.client->call("noargs");
    auto frame = h.transport->last_frame();
    CATCH_REQUIRE(frame["msg"].asString() == "method");
    CATCH_REQUIRE(!frame.isMember("params"));
    CATCH_REQUIRE(frame["id"].asString().size() == 36);

    h.client->call_with_seed("seeded", std::string{"abc"}, array_of({1, 2}));
    frame = h.transport->last_frame();
    CATCH_REQUIRE(frame["method"].asString() == "seeded");
    CATCH_REQUIRE(frame["randomSeed"].asString() == "abc");
    CATCH_REQUIRE(frame["params"] == array_of({1, 2}));

    Json::Value doc{Json::objectValue};
    doc["text"] = "milk";
    h.client->insert("tasks", doc);
    frame = h.transport->last_frame();
    CATCH_REQUIRE(frame["method"].asString() == "/tasks/insert");
    CATCH_REQUIRE(frame["params"] == array_of({doc}));

    Json::Value selector{Json::objectValue};
    selector["_id"] = "t1";
    Json::Value modifier{Json::objectValue};
    modifier["$set"] = doc;
    h.client->update("tasks", selector, modifier);
    frame = h.transport->last_frame();
    CATCH_REQUIRE(frame["method"].asString() == "/tasks/update");
    const auto no_options = Json::Value{Json::objectValue};
    CATCH_REQUIRE(frame["params"] == array_of({selector, modifier, no_options}));

    h.client->remove("tasks", "t1");
    frame = h.transport->last_frame();
    CATCH_REQUIRE(frame["method"].asString() == "/tasks/remove");
    CATCH_REQUIRE(frame["params"] == array_of({selector}));

    // No handlers were given, so nothing waits on a reply
    CATCH_REQUIRE(h.client->pending_count() == 0);
  }

  CATCH_SECTION("ping-pong") {
    Harness h;
    h.transport->emit_connected();
    h.transport->emit_message(R"({"msg":"ping","id":"p1"})");
    auto pong = h.transport->last_frame();
    CATCH_REQUIRE(pong["msg"].asString() == "pong");
    CATCH_REQUIRE(pong["id"].asString() == "p1");

    h.transport->emit_message(R"({"msg":"ping"})");
    pong = h.transport->last_frame();
    CATCH_REQUIRE(pong["msg"].asString() == "pong");
    CATCH_REQUIRE(!pong.isMember("id"));
  }
}

CATCH_TEST_CASE("ddp-client-replies", "[ddp-client]") {
  //

  CATCH_SECTION("subscribe-ready") {
    Harness h;
    h.transport->emit_connected();

    int todos_ready = 0;
    int lists_ready = 0;
    const auto todos =
        h.client->subscribe("todos", Json::Value{}, [&](const Status& status) {
          CATCH_REQUIRE(status.ok());
          ++todos_ready;
        });
    const auto frame = h.transport->last_frame();
    CATCH_REQUIRE(frame.size() == 3);
    CATCH_REQUIRE(frame["msg"].asString() == "sub");
    CATCH_REQUIRE(frame["name"].asString() == "todos");
    CATCH_REQUIRE(frame["id"].asString() == todos);

    const auto lists =
        h.client->subscribe("lists", array_of({"mine"}), [&](const Status&) { ++lists_ready; });
    CATCH_REQUIRE(todos != lists);
    CATCH_REQUIRE(h.client->pending_count() == 2);

    h.transport->emit_message(format(R"({{"msg":"ready","subs":["{}","{}"]}})", todos, lists));
    CATCH_REQUIRE(todos_ready == 1);
    CATCH_REQUIRE(lists_ready == 1);
    CATCH_REQUIRE(h.client->pending_count() == 0);

    h.transport->emit_message(format(R"({{"msg":"ready","subs":["{}"]}})", todos));
    CATCH_REQUIRE(todos_ready == 1);
  }

  CATCH_SECTION("method-result") {
    Harness h;
    h.transport->emit_connected();

    std::vector<std::pair<Status, std::string>> replies;
    auto handler = [&](const Status& status, std::string_view result) {
      replies.emplace_back(status, std::string{result});
    };

    h.client->call("good", Json::Value{}, handler);
    const auto good = h.transport->last_frame()["id"].asString();
    h.client->call("bad", Json::Value{}, handler);
    const auto bad = h.transport->last_frame()["id"].asString();
    CATCH_REQUIRE(h.client->pending_count() == 2);

    h.transport->emit_message(
        format(R"({{"msg":"result","id":"{}","error":{{"error":403,"reason":"Denied"}}}})", bad));
    CATCH_REQUIRE(replies.size() == 1);
    CATCH_REQUIRE(!replies[0].first.ok());
    CATCH_REQUIRE(replies[0].first.code() == StatusCode::METHOD_ERROR);
    CATCH_REQUIRE(replies[0].first.error() == "403");
    CATCH_REQUIRE(replies[0].first.reason() == "Denied");

    h.transport->emit_message(format(R"({{"msg":"result","id":"{}","result":{{"n":1}}}})", good));
    CATCH_REQUIRE(replies.size() == 2);
    CATCH_REQUIRE(replies[1].first.ok());
    CATCH_REQUIRE(replies[1].second == R"({"n":1})");

    // Removed before it ran, so a repeated reply is ignored
    h.transport->emit_message(format(R"({{"msg":"result","id":"{}","result":2}})", good));
    CATCH_REQUIRE(replies.size() == 2);
    CATCH_REQUIRE(h.client->pending_count() == 0);
  }

  CATCH_SECTION("replies-are-kind-aware") {
    Harness h;
    h.transport->emit_connected();

    int calls = 0;
    const auto sub = h.client->subscribe("todos", Json::Value{}, [&](const Status&) { ++calls; });
    h.transport->emit_message(format(R"({{"msg":"result","id":"{}","result":1}})", sub));
    CATCH_REQUIRE(calls == 0);
    CATCH_REQUIRE(h.client->pending_count() == 1);

    h.client->call("m", Json::Value{}, [&](const Status&, std::string_view) { ++calls; });
    const auto method = h.transport->last_frame()["id"].asString();
    h.transport->emit_message(format(R"({{"msg":"ready","subs":["{}"]}})", method));
    h.transport->emit_message(format(R"({{"msg":"nosub","id":"{}"}})", method));
    CATCH_REQUIRE(calls == 0);
    CATCH_REQUIRE(h.client->pending_count() == 2);
  }

  CATCH_SECTION("nosub") {
    Harness h;
    h.transport->emit_connected();

    std::vector<Status> outcomes;
    auto handler = [&](const Status& status) { outcomes.push_back(status); };
    const auto rejected = h.client->subscribe("secret", Json::Value{}, handler);
    const auto cancelled = h.client->subscribe("todos", Json::Value{}, handler);

    h.transport->emit_message(format(
        R"({{"msg":"nosub","id":"{}","error":{{"error":"not-allowed","reason":"no"}}}})",
        rejected));
    h.transport->emit_message(format(R"({{"msg":"nosub","id":"{}"}})", cancelled));
    CATCH_REQUIRE(outcomes.size() == 2);
    CATCH_REQUIRE(outcomes[0].code() == StatusCode::SUBSCRIPTION_ERROR);
    CATCH_REQUIRE(outcomes[0].error() == "not-allowed");
    CATCH_REQUIRE(outcomes[1].code() == StatusCode::CANCELLED);

    // An unsubscription may be registered for any id
    int unsubscribed = 0;
    h.client->unsubscribe("never-subscribed", [&]() { ++unsubscribed; });
    CATCH_REQUIRE(h.transport->last_frame()["msg"].asString() == "unsub");
    CATCH_REQUIRE(h.transport->last_frame()["id"].asString() == "never-subscribed");
    h.transport->emit_message(R"({"msg":"nosub","id":"never-subscribed"})");
    CATCH_REQUIRE(unsubscribed == 1);

    // Unknown ids are ignored
    h.transport->emit_message(R"({"msg":"nosub","id":"unknown"})");
    CATCH_REQUIRE(outcomes.size() == 2);
    CATCH_REQUIRE(unsubscribed == 1);
  }
}

CATCH_TEST_CASE("ddp-client-inbound", "[ddp-client]") {
  //

  CATCH_SECTION("data-changes") {
    Harness h;
    h.transport->emit_connected();
    h.transport->emit_message(
        R"({"msg":"added","collection":"tasks","id":"t1","fields":{"text":"milk"}})");
    h.transport->emit_message(R"({"msg":"addedBefore","collection":"tasks","id":"t2"})");
    h.transport->emit_message(R"({"msg":"changed","collection":"tasks","id":"t1",)"
                              R"("fields":{"done":true},"cleared":["text"]})");
    h.transport->emit_message(R"({"msg":"removed","collection":"tasks","id":"t1"})");

    const std::vector<std::string> expected = {
        R"(added tasks t1 {"text":"milk"})",
        "added tasks t2 ",
        R"(changed tasks t1 {"done":true} ["text"])",
        "removed tasks t1",
    };
    CATCH_REQUIRE(h.listener->data == expected);
  }

  CATCH_SECTION("faults-do-not-end-the-session") {
    Harness h;
    h.transport->emit_connected();
    h.transport->emit_message("{not json");
    CATCH_REQUIRE(h.listener->saw(ecode::malformed_frame));
    h.transport->emit_message(R"({"msg":"error","reason":"Bad request"})");
    CATCH_REQUIRE(h.listener->saw(ecode::server_error));
    h.transport->emit_message(R"({"msg":"updated","methods":["x"]})");
    h.transport->emit_message(R"({"server_id":"0"})");
    CATCH_REQUIRE(h.listener->exceptions.size() == 2);

    // Nested past the json reader's depth limit
    h.transport->emit_message(format(R"({{"msg":"added","collection":"c","id":"x","fields":{}{}}})",
                                     std::string(1200, '['), std::string(1200, ']')));
    CATCH_REQUIRE(h.listener->exceptions.size() == 3);
    CATCH_REQUIRE(h.listener->exceptions[2] == ecode::malformed_frame);
    CATCH_REQUIRE(h.listener->data.empty());
    CATCH_REQUIRE(h.client->is_connected());
    CATCH_REQUIRE(h.listener->disconnects.empty());
  }
}

CATCH_TEST_CASE("ddp-client-negotiation", "[ddp-client]") {
  //

  CATCH_SECTION("failed-adopts-supported-version") {
    Harness h;
    h.transport->emit_connected("s1");
    h.transport->emit_close();
    h.transport->emit_open();
    CATCH_REQUIRE(h.transport->last_frame()["session"].asString() == "s1"); // Resuming

    h.transport->emit_message(R"({"msg":"failed","version":"pre1"})");
    CATCH_REQUIRE(h.transport->connects.size() == 3);
    CATCH_REQUIRE(h.client->protocol_version() == "pre1");
    CATCH_REQUIRE(!h.client->session_id());

    h.transport->emit_open();
    const auto connect = h.transport->last_frame();
    CATCH_REQUIRE(connect["version"].asString() == "pre1");
    CATCH_REQUIRE(!connect.isMember("session"));
  }

  CATCH_SECTION("failed-without-version-is-ignored") {
    Harness h;
    h.transport->emit_open();
    h.transport->emit_message(R"({"msg":"failed"})");

    CATCH_REQUIRE(h.transport->connects.size() == 1);
    CATCH_REQUIRE(h.transport->disconnects == 0);
    CATCH_REQUIRE(h.client->state() == ConnectionState::AWAITING_HANDSHAKE);
    CATCH_REQUIRE(h.listener->exceptions.empty());
    CATCH_REQUIRE(h.listener->disconnects.empty());

    h.transport->emit_message(R"({"msg":"connected","session":"s1"})");
    CATCH_REQUIRE(h.client->is_connected());
  }

  CATCH_SECTION("failed-proposing-current-version-connects-again") {
    Harness h;
    h.transport->emit_open();
    h.transport->emit_message(R"({"msg":"failed","version":"1"})");
    CATCH_REQUIRE(h.transport->connects.size() == 2);
    CATCH_REQUIRE(h.transport->disconnects == 0);
    CATCH_REQUIRE(h.client->state() == ConnectionState::CONNECTING);
    CATCH_REQUIRE(h.client->protocol_version() == "1");
    CATCH_REQUIRE(h.listener->disconnects.empty());

    h.transport->emit_open();
    CATCH_REQUIRE(h.transport->last_frame()["version"].asString() == "1");
    h.transport->emit_connected("s1");
    CATCH_REQUIRE(h.client->is_connected());
  }

  CATCH_SECTION("endless-failed-replies-are-bounded") {
    Harness h;
    for (std::size_t i = 0; i < 5; ++i) {
      h.transport->emit_open();
      h.transport->emit_message(R"({"msg":"failed","version":"1"})");
      CATCH_REQUIRE(h.transport->connects.size() == i + 2);
    }
    CATCH_REQUIRE(h.listener->disconnects.empty());

    h.transport->emit_open();
    h.transport->emit_message(R"({"msg":"failed","version":"1"})");
    CATCH_REQUIRE(h.transport->connects.size() == 6);
    CATCH_REQUIRE(h.transport->disconnects == 1);
    CATCH_REQUIRE(h.client->state() == ConnectionState::DISCONNECTED);
    CATCH_REQUIRE(h.listener->saw(ecode::unsupported_version));
    CATCH_REQUIRE(h.listener->disconnects.size() == 1);
  }

  CATCH_SECTION("failed-unsupported-version-is-fatal") {
    Harness h;
    h.transport->emit_open();
    h.client->call("m", Json::Value{}, [](const Status&, std::string_view) {});
    h.transport->emit_message(R"({"msg":"failed","version":"v99"})");

    CATCH_REQUIRE(h.transport->connects.size() == 1);
    CATCH_REQUIRE(h.transport->disconnects == 1);
    CATCH_REQUIRE(h.client->state() == ConnectionState::DISCONNECTED);
    CATCH_REQUIRE(h.client->pending_count() == 0);
    CATCH_REQUIRE(h.listener->saw(ecode::unsupported_version));
    CATCH_REQUIRE(h.listener->disconnects.size() == 1);
    CATCH_REQUIRE(h.listener->disconnects[0].first == 1002);
  }
}

CATCH_TEST_CASE("ddp-client-reconnect", "[ddp-client]") {
  //

  CATCH_SECTION("in-flight-calls-survive-reconnect") {
    Harness h;
    h.transport->emit_connected("s1");

    int replies = 0;
    Json::Value doc{Json::objectValue};
    doc["text"] = "milk";
    h.client->call("/tasks/insert", array_of({doc}),
                   [&](const Status& status, std::string_view) {
                     CATCH_REQUIRE(status.ok());
                     ++replies;
                   });
    const auto id = h.transport->last_frame()["id"].asString();
    const auto sent_before = h.transport->sent.size();

    h.transport->emit_close();
    CATCH_REQUIRE(h.transport->connects.size() == 2);
    CATCH_REQUIRE(h.client->reconnect_attempts() == 1);
    CATCH_REQUIRE(h.listener->disconnects.empty());

    h.transport->emit_connected("s1");
    CATCH_REQUIRE(h.client->reconnect_attempts() == 0);
    CATCH_REQUIRE(h.transport->sent.size() == sent_before + 1); // Only the handshake
    CATCH_REQUIRE(h.transport->last_frame()["msg"].asString() == "connect");
    CATCH_REQUIRE(h.transport->last_frame()["session"].asString() == "s1");
    CATCH_REQUIRE(h.client->pending_count() == 1);
    CATCH_REQUIRE(replies == 0);

    h.transport->emit_message(format(R"({{"msg":"result","id":"{}","result":"t1"}})", id));
    CATCH_REQUIRE(replies == 1);
    CATCH_REQUIRE(h.listener->connects == 2);
  }

  CATCH_SECTION("gives-up-after-five-attempts") {
    Harness h;
    h.transport->emit_connected("s1");
    h.client->call("m", Json::Value{}, [](const Status&, std::string_view) {});

    h.transport->emit_close(); // Session lost
    for (auto i = 0; i < 4; ++i)
      h.transport->emit_close(); // Reconnect attempt fails
    CATCH_REQUIRE(h.transport->connects.size() == 6);
    CATCH_REQUIRE(h.client->reconnect_attempts() == 5);
    CATCH_REQUIRE(h.listener->disconnects.empty());

    h.transport->emit_close(1006, "still gone"); // The fifth attempt fails
    CATCH_REQUIRE(h.transport->connects.size() == 6);
    CATCH_REQUIRE(h.client->state() == ConnectionState::DISCONNECTED);
    CATCH_REQUIRE(h.client->pending_count() == 0);
    CATCH_REQUIRE(!h.client->session_id());
    CATCH_REQUIRE(h.listener->saw(ecode::reconnect_exhausted));
    CATCH_REQUIRE(h.listener->disconnects.size() == 1);
    CATCH_REQUIRE(h.listener->disconnects[0].second == "still gone");

    // A manual reconnect is honored
    h.client->reconnect();
    CATCH_REQUIRE(h.transport->connects.size() == 7);
    h.transport->emit_connected("s2");
    CATCH_REQUIRE(h.client->is_connected());
    CATCH_REQUIRE(h.listener->disconnects.size() == 1);
  }

  CATCH_SECTION("attempts-reset-when-transport-opens") {
    Harness h;
    h.transport->emit_connected("s1");
    h.transport->emit_close();
    h.transport->emit_close();
    CATCH_REQUIRE(h.client->reconnect_attempts() == 2);
    h.transport->emit_open();
    CATCH_REQUIRE(h.client->reconnect_attempts() == 0);
  }
}

} // namespace ddp::test
