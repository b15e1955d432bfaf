#pragma once

#include "transport.hpp"

#include "ddp/utils.hpp"

#include <chrono>

namespace boost::asio {
class io_context;
}

namespace ddp::net {

// ------------------------------------------------------------------------------ WebsocketTransport

/**
 * @brief A `Transport` over Boost.Beast websockets, for `ws://` and `wss://` urls.
 *
 * All io happens on the passed `io_context`, which must outlive the transport.
 * Listener events are delivered on the threads running the `io_context`.
 */
class WebsocketTransport final : public Transport {
private:
  struct Pimpl;
  std::unique_ptr<Pimpl> pimpl_;

public:
  struct Config {
    bool verify_peer = true;                             //! Verify the server's TLS certificate
    std::chrono::milliseconds connect_timeout{30 * 1000}; //! Resolve, connect, and handshakes
    string user_agent = "meteor-ddp";                    //! Sent with the websocket handshake
  };

  /**
   * Exceptions
   * + std::bad_alloc
   * + boost::system::system_error if the TLS context cannot be set up
   */
  WebsocketTransport(boost::asio::io_context& io_context, Config config);
  explicit WebsocketTransport(boost::asio::io_context& io_context);
  WebsocketTransport(const WebsocketTransport&) = delete;
  WebsocketTransport(WebsocketTransport&&) = delete;
  ~WebsocketTransport() override;
  WebsocketTransport& operator=(const WebsocketTransport&) = delete;
  WebsocketTransport& operator=(WebsocketTransport&&) = delete;

  void connect(std::string_view url, TransportListener& listener) override;
  void disconnect() override;
  bool send_text(std::string_view text) override;
  bool is_open() const override;
};

} // namespace ddp::net
