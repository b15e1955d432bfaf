
#include "stdinc.hpp"

#include "ddp/protocol/frames.hpp"

#include <catch2/catch.hpp>

namespace ddp::protocol::test {

static Json::Value parse(std::string_view text) {
  auto parsed = parse_json(text);
  CATCH_REQUIRE(parsed.has_value());
  return *parsed;
}

template <typename T> static T decode_as(std::string_view text) {
  auto decoded = decode_frame(text);
  CATCH_REQUIRE(decoded.has_value());
  CATCH_REQUIRE(std::holds_alternative<T>(*decoded));
  return std::get<T>(*decoded);
}

static std::string deeply_nested(std::size_t depth) {
  return format(R"({{"msg":"added","collection":"c","id":"x","fields":{}1{}}})",
                std::string(depth, '['), std::string(depth, ']'));
}

static std::error_code decode_error(std::string_view text) {
  auto decoded = decode_frame(text);
  CATCH_REQUIRE(!decoded.has_value());
  return decoded.error();
}

// ------------------------------------------------------------------- TEST_CASE
//
CATCH_TEST_CASE("frame-encoders", "[frames]") {
  //

  CATCH_SECTION("connect") {
    const auto frame = make_connect_frame("1", std::nullopt);
    CATCH_REQUIRE(frame["msg"].asString() == "connect");
    CATCH_REQUIRE(frame["version"].asString() == "1");
    CATCH_REQUIRE(frame["support"].size() == 3);
    CATCH_REQUIRE(frame["support"][0].asString() == "1");
    CATCH_REQUIRE(frame["support"][1].asString() == "pre2");
    CATCH_REQUIRE(frame["support"][2].asString() == "pre1");
    CATCH_REQUIRE(!frame.isMember("session"));

    const auto resume = make_connect_frame("pre2", std::string{"abc"});
    CATCH_REQUIRE(resume["version"].asString() == "pre2");
    CATCH_REQUIRE(resume["session"].asString() == "abc");
  }

  CATCH_SECTION("method") {
    const auto bare = make_method_frame("ping", "id-1", Json::Value{}, std::nullopt);
    CATCH_REQUIRE(bare["msg"].asString() == "method");
    CATCH_REQUIRE(bare["method"].asString() == "ping");
    CATCH_REQUIRE(bare["id"].asString() == "id-1");
    CATCH_REQUIRE(!bare.isMember("params"));
    CATCH_REQUIRE(!bare.isMember("randomSeed"));

    Json::Value params{Json::arrayValue};
    params.append(42);
    params.append("text");
    const auto full = make_method_frame("add", "id-2", params, std::string{"seed"});
    CATCH_REQUIRE(full["params"] == params);
    CATCH_REQUIRE(full["randomSeed"].asString() == "seed");
  }

  CATCH_SECTION("sub-unsub-pong") {
    const auto sub = make_sub_frame("todos", "sub-1", Json::Value{});
    CATCH_REQUIRE(sub["msg"].asString() == "sub");
    CATCH_REQUIRE(sub["name"].asString() == "todos");
    CATCH_REQUIRE(sub["id"].asString() == "sub-1");
    CATCH_REQUIRE(!sub.isMember("params"));
    CATCH_REQUIRE(sub.size() == 3);

    const auto unsub = make_unsub_frame("sub-1");
    CATCH_REQUIRE(unsub["msg"].asString() == "unsub");
    CATCH_REQUIRE(unsub["id"].asString() == "sub-1");

    CATCH_REQUIRE(make_pong_frame(std::nullopt).size() == 1);
    CATCH_REQUIRE(make_pong_frame(std::string{"p1"})["id"].asString() == "p1");
  }

  CATCH_SECTION("serialize") {
    const auto text = serialize_frame(make_unsub_frame("x"));
    CATCH_REQUIRE(text.has_value());
    CATCH_REQUIRE(*text == R"({"id":"x","msg":"unsub"})");

    const auto utf8 = serialize_frame(make_sub_frame("caf\xc3\xa9", "1", Json::Value{}));
    CATCH_REQUIRE(utf8.has_value());
    CATCH_REQUIRE(parse(*utf8)["name"].asString() == "caf\xc3\xa9");
  }
}

CATCH_TEST_CASE("frame-decoders", "[frames]") {
  //

  CATCH_SECTION("malformed") {
    CATCH_REQUIRE(decode_error("not json") == ecode::malformed_frame);
    CATCH_REQUIRE(decode_error("") == ecode::malformed_frame);
    CATCH_REQUIRE(decode_error(R"(["connected"])") == ecode::malformed_frame);
    CATCH_REQUIRE(decode_error(R"({"msg":"result","id":7})") == ecode::malformed_frame);
    CATCH_REQUIRE(decode_error(R"({"msg":"ready","subs":"a"})") == ecode::malformed_frame);
    CATCH_REQUIRE(decode_error(R"({"msg":"ready","subs":["a",1]})") == ecode::malformed_frame);
    CATCH_REQUIRE(decode_error(R"({"msg":"nosub","id":"a","error":"boom"})")
                  == ecode::malformed_frame);
    CATCH_REQUIRE(decode_error(deeply_nested(1200)) == ecode::malformed_frame);
    CATCH_REQUIRE(!parse_json(deeply_nested(1200)).has_value());
  }

  CATCH_SECTION("ignored") {
    CATCH_REQUIRE(decode_as<IgnoredMessage>(R"({"server_id":"0"})").msg.empty());
    CATCH_REQUIRE(decode_as<IgnoredMessage>(R"({"msg":"updated","methods":["1"]})").msg
                  == "updated");
  }

  CATCH_SECTION("session") {
    CATCH_REQUIRE(decode_as<ConnectedMessage>(R"({"msg":"connected","session":"s1"})").session
                  == "s1");
    CATCH_REQUIRE(!decode_as<ConnectedMessage>(R"({"msg":"connected"})").session);
    CATCH_REQUIRE(decode_as<FailedMessage>(R"({"msg":"failed","version":"pre1"})").version
                  == "pre1");
    CATCH_REQUIRE(decode_as<PingMessage>(R"({"msg":"ping","id":"p"})").id == "p");
    CATCH_REQUIRE(!decode_as<PingMessage>(R"({"msg":"ping"})").id);
  }

  CATCH_SECTION("data") {
    const auto added =
        decode_as<AddedMessage>(R"({"msg":"added","collection":"tasks","id":"t1",)"
                                R"("fields":{"text":"milk"}})");
    CATCH_REQUIRE(added.collection == "tasks");
    CATCH_REQUIRE(added.id == "t1");
    CATCH_REQUIRE(added.fields == R"({"text":"milk"})");
    CATCH_REQUIRE(!added.before);

    const auto before = decode_as<AddedMessage>(
        R"({"msg":"addedBefore","collection":"tasks","id":"t2","before":null})");
    CATCH_REQUIRE(before.id == "t2");
    CATCH_REQUIRE(!before.fields);
    CATCH_REQUIRE(before.before == "null");

    const auto changed =
        decode_as<ChangedMessage>(R"({"msg":"changed","collection":"tasks","id":"t1",)"
                                  R"("fields":{"done":true},"cleared":["text"]})");
    CATCH_REQUIRE(changed.fields == R"({"done":true})");
    CATCH_REQUIRE(changed.cleared == R"(["text"])");

    const auto removed =
        decode_as<RemovedMessage>(R"({"msg":"removed","collection":"tasks","id":"t1"})");
    CATCH_REQUIRE(removed.collection == "tasks");
    CATCH_REQUIRE(removed.id == "t1");
  }

  CATCH_SECTION("replies") {
    const auto ok = decode_as<ResultMessage>(R"({"msg":"result","id":"m1","result":[1,2]})");
    CATCH_REQUIRE(ok.id == "m1");
    CATCH_REQUIRE(ok.result == "[1,2]");
    CATCH_REQUIRE(!ok.error);

    const auto failed = decode_as<ResultMessage>(
        R"({"msg":"result","id":"m2","error":{"error":404,"reason":"Not found",)"
        R"("details":{"path":"/x"}}})");
    CATCH_REQUIRE(failed.error.has_value());
    CATCH_REQUIRE(failed.error->code() == StatusCode::METHOD_ERROR);
    CATCH_REQUIRE(failed.error->error() == "404");
    CATCH_REQUIRE(failed.error->reason() == "Not found");
    CATCH_REQUIRE(failed.error->details() == R"({"path":"/x"})");

    const auto ready = decode_as<ReadyMessage>(R"({"msg":"ready","subs":["a","b"]})");
    CATCH_REQUIRE(ready.subs == std::vector<std::string>{"a", "b"});

    const auto nosub = decode_as<NoSubMessage>(R"({"msg":"nosub","id":"a"})");
    CATCH_REQUIRE(nosub.id == "a");
    CATCH_REQUIRE(!nosub.error);

    const auto nosub_error = decode_as<NoSubMessage>(
        R"({"msg":"nosub","id":"a","error":{"error":"sub-not-found","reason":"nope"}})");
    CATCH_REQUIRE(nosub_error.error->code() == StatusCode::SUBSCRIPTION_ERROR);
    CATCH_REQUIRE(nosub_error.error->error() == "sub-not-found");
    CATCH_REQUIRE(nosub_error.error->details().empty());
  }

  CATCH_SECTION("server-error") {
    const auto error = decode_as<ServerErrorMessage>(
        R"({"msg":"error","reason":"Bad request","offendingMessage":{"msg":"bogus"}})");
    CATCH_REQUIRE(error.reason == "Bad request");
    CATCH_REQUIRE(error.offending_message == R"({"msg":"bogus"})");
  }
}

} // namespace ddp::protocol::test
