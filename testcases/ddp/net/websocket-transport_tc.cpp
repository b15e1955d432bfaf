
#include "stdinc.hpp"

#include "ddp/net/websocket-transport.hpp"
#include "ddp/utils/error-codes.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include <catch2/catch.hpp>

namespace ddp::net::test {

namespace asio = boost::asio;
namespace beast = boost::beast;
using tcp = asio::ip::tcp;

// -------------------------------------------------------------------------------------- TestServer

/**
 * Serves exactly one websocket connection on 127.0.0.1, on its own thread.
 */
class TestServer {
public:
  enum class Mode : int { ECHO, CLOSE };

private:
  asio::io_context io_context_;
  tcp::acceptor acceptor_{io_context_, {asio::ip::make_address("127.0.0.1"), 0}};
  std::thread thread_;

  void serve_(Mode mode) {
    try {
      tcp::socket socket{io_context_};
      acceptor_.accept(socket);
      beast::websocket::stream<tcp::socket> ws{std::move(socket)};
      ws.accept();

      if (mode == Mode::CLOSE) {
        ws.close(beast::websocket::close_reason{beast::websocket::close_code::normal, "bye"});
        return;
      }

      beast::flat_buffer buffer;
      ws.read(buffer);
      ws.text(ws.got_text());
      ws.write(buffer.data());
      buffer.consume(buffer.size());
      ws.read(buffer); // Until the client closes
    } catch (const boost::system::system_error& e) {
      INFO("test server finished: {}", e.code().message());
    }
  }

public:
  explicit TestServer(Mode mode) : thread_{[this, mode]() { serve_(mode); }} {}
  ~TestServer() { thread_.join(); }

  uint16_t port() const { return acceptor_.local_endpoint().port(); }
  string url() const { return format("ws://127.0.0.1:{}/websocket", port()); }
};

// ---------------------------------------------------------------------------------------- Recorder

struct Recorder final : public TransportListener {
  Transport* transport = nullptr;
  bool send_on_open = false;
  int opens = 0;
  std::vector<std::string> messages;
  std::vector<std::pair<uint16_t, std::string>> closes;
  std::vector<std::error_code> errors;

  void on_transport_open() override {
    ++opens;
    if (send_on_open)
      CATCH_REQUIRE(transport->send_text("hello"));
  }

  void on_transport_close(uint16_t code, std::string_view reason) override {
    closes.emplace_back(code, std::string{reason});
  }

  void on_transport_message(std::string_view text) override {
    messages.emplace_back(text);
    transport->disconnect(); // Silent: no close is reported
  }

  void on_transport_error(TransportOperation, std::error_code ec) override {
    errors.push_back(ec);
  }
};

static uint16_t unused_port() {
  asio::io_context io_context;
  tcp::acceptor acceptor{io_context, {asio::ip::make_address("127.0.0.1"), 0}};
  return acceptor.local_endpoint().port();
}

// ------------------------------------------------------------------- TEST_CASE
//
CATCH_TEST_CASE("websocket-transport", "[websocket-transport]") {
  //

  CATCH_SECTION("invalid-url-is-reported-at-once") {
    asio::io_context io_context;
    WebsocketTransport transport{io_context};
    Recorder recorder;
    recorder.transport = &transport;

    CATCH_REQUIRE(!transport.is_open());
    CATCH_REQUIRE(!transport.send_text("nobody listening"));

    transport.connect("http://localhost", recorder);
    CATCH_REQUIRE(recorder.errors.size() == 1);
    CATCH_REQUIRE(recorder.errors[0] == ecode::invalid_url);
    CATCH_REQUIRE(recorder.closes.size() == 1);
    CATCH_REQUIRE(recorder.closes[0].first == 1006);
  }

  CATCH_SECTION("refused") {
    asio::io_context io_context;
    WebsocketTransport transport{io_context};
    Recorder recorder;
    recorder.transport = &transport;

    transport.connect(format("ws://127.0.0.1:{}/websocket", unused_port()), recorder);
    io_context.run();
    CATCH_REQUIRE(recorder.opens == 0);
    CATCH_REQUIRE(recorder.errors.size() == 1);
    CATCH_REQUIRE(recorder.closes.size() == 1);
    CATCH_REQUIRE(recorder.closes[0].first == 1006);
  }

  CATCH_SECTION("echo-then-silent-disconnect") {
    TestServer server{TestServer::Mode::ECHO};
    asio::io_context io_context;
    WebsocketTransport transport{io_context};
    Recorder recorder;
    recorder.transport = &transport;
    recorder.send_on_open = true;

    transport.connect(server.url(), recorder);
    io_context.run();
    CATCH_REQUIRE(recorder.opens == 1);
    CATCH_REQUIRE(recorder.messages == std::vector<std::string>{"hello"});
    CATCH_REQUIRE(recorder.closes.empty());
    CATCH_REQUIRE(recorder.errors.empty());
    CATCH_REQUIRE(!transport.is_open());
  }

  CATCH_SECTION("server-close-is-reported-once") {
    TestServer server{TestServer::Mode::CLOSE};
    asio::io_context io_context;
    WebsocketTransport transport{io_context};
    Recorder recorder;
    recorder.transport = &transport;

    transport.connect(server.url(), recorder);
    io_context.run();
    CATCH_REQUIRE(recorder.opens == 1);
    CATCH_REQUIRE(recorder.closes.size() == 1);
    CATCH_REQUIRE(recorder.closes[0].first == 1000);
    CATCH_REQUIRE(recorder.closes[0].second == "bye");
    CATCH_REQUIRE(!transport.is_open());
  }
}

} // namespace ddp::net::test
