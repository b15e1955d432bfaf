#include "websocket-transport.hpp"

#include "url.hpp"

#include <boost/asio/dispatch.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include <atomic>
#include <deque>
#include <mutex>
#include <type_traits>
#include <utility>

namespace ddp::net {

namespace asio = boost::asio;
namespace beast = boost::beast;

} // namespace ddp::net

namespace ddp::net::detail {

//! RFC 6455 code for a connection that went away without a close frame
constexpr uint16_t k_close_abnormal = 1006;

// ------------------------------------------------------------------------------------ ListenerSlot

/**
 * Shared between the transport and one connection. The transport empties the
 * slot when it is done with the connection, so late events are dropped.
 * Recursive, because listeners may reconnect from inside a callback.
 */
class ListenerSlot {
private:
  std::recursive_mutex padlock_;
  std::atomic<bool> cancelled_{false};
  TransportListener* listener_{nullptr};
  bool close_reported_{false};

public:
  explicit ListenerSlot(TransportListener& listener) : listener_{&listener} {}

  //! Stops new events without waiting for one in flight
  void cancel() { cancelled_.store(true, std::memory_order_release); }

  //! Stops new events, and waits for one in flight to return
  void detach() {
    cancel();
    std::lock_guard lock{padlock_};
    listener_ = nullptr;
  }

  template <typename F> void notify(F&& f) {
    std::lock_guard lock{padlock_};
    if (listener_ == nullptr || close_reported_ || cancelled_.load(std::memory_order_acquire))
      return;
    try {
      f(*listener_);
    } catch (std::exception& e) {
      FATAL("transport listener must not throw: {}", e.what());
    }
  }

  void notify_error(TransportOperation operation, std::error_code ec) {
    notify([&](TransportListener& listener) { listener.on_transport_error(operation, ec); });
  }

  void notify_close(uint16_t code, std::string_view reason) {
    std::lock_guard lock{padlock_};
    notify([&](TransportListener& listener) { listener.on_transport_close(code, reason); });
    close_reported_ = true;
  }
};

// ---------------------------------------------------------------------------------- ConnectionBase

class ConnectionBase {
public:
  virtual ~ConnectionBase() = default;
  virtual void start() = 0;
  virtual void send(std::string text) = 0;
  virtual void close() = 0;
  virtual bool is_open() const = 0;
};

// -------------------------------------------------------------------------------------- Connection

using PlainStream = beast::websocket::stream<beast::tcp_stream>;
using TlsStream = beast::websocket::stream<beast::ssl_stream<beast::tcp_stream>>;

template <typename WsStream>
class Connection final : public ConnectionBase,
                         public std::enable_shared_from_this<Connection<WsStream>> {
private:
  static constexpr bool k_is_tls = std::is_same_v<WsStream, TlsStream>;

  std::shared_ptr<ListenerSlot> slot_;
  WebsocketUrl url_;
  std::chrono::milliseconds timeout_;
  string user_agent_;

  WsStream ws_;
  asio::ip::tcp::resolver resolver_;
  beast::flat_buffer buffer_;
  string host_header_;

  std::deque<string> outbox_; //! Only touched on the strand
  std::atomic<bool> is_open_{false};

public:
  template <typename... StreamArgs>
  Connection(std::shared_ptr<ListenerSlot> slot, WebsocketUrl url,
             const WebsocketTransport::Config& config, asio::io_context& ioc,
             StreamArgs&&... stream_args)
      : slot_{std::move(slot)}, url_{std::move(url)}, timeout_{config.connect_timeout},
        user_agent_{config.user_agent},
        ws_{asio::make_strand(ioc), std::forward<StreamArgs>(stream_args)...},
        resolver_{ws_.get_executor()} {}

  bool is_open() const override { return is_open_.load(std::memory_order_acquire); }

  void start() override {
    TRACE("connecting to {}:{}{}", url_.host, url_.port, url_.target);
    asio::dispatch(ws_.get_executor(), [self = this->shared_from_this()]() {
      self->resolver_.async_resolve(
          self->url_.host, std::to_string(self->url_.port),
          beast::bind_front_handler(&Connection::on_resolve_, self->shared_from_this()));
    });
  }

  void send(std::string text) override {
    asio::post(ws_.get_executor(),
               [self = this->shared_from_this(), text = std::move(text)]() mutable {
                 self->outbox_.push_back(std::move(text));
                 if (self->outbox_.size() == 1) // Otherwise a write is already in flight
                   self->do_write_();
               });
  }

  void close() override {
    asio::post(ws_.get_executor(), [self = this->shared_from_this()]() {
      self->resolver_.cancel();
      if (self->is_open_.exchange(false)) {
        self->ws_.async_close(beast::websocket::close_code::normal, [self](beast::error_code ec) {
          if (ec)
            TRACE("close: {}", ec.message());
        });
      } else {
        beast::get_lowest_layer(self->ws_).cancel();
      }
    });
  }

private:
  void fail_(TransportOperation operation, beast::error_code ec) {
    TRACE("websocket error on op={}: {}", str(operation), ec.message());
    is_open_.store(false, std::memory_order_release);
    slot_->notify_error(operation, ec);
    slot_->notify_close(k_close_abnormal, ec.message());
  }

  void on_resolve_(beast::error_code ec, asio::ip::tcp::resolver::results_type results) {
    if (ec)
      return fail_(TransportOperation::CONNECT, ec);

    // Set a timeout on the operation
    beast::get_lowest_layer(ws_).expires_after(timeout_);

    // Make the connection on the IP address we get from a lookup
    beast::get_lowest_layer(ws_).async_connect(
        results, beast::bind_front_handler(&Connection::on_connect_, this->shared_from_this()));
  }

  void on_connect_(beast::error_code ec, asio::ip::tcp::resolver::results_type::endpoint_type ep) {
    if (ec)
      return fail_(TransportOperation::CONNECT, ec);

    // This will provide the value of the Host HTTP header during the WebSocket handshake.
    // See https://tools.ietf.org/html/rfc7230#section-5.4
    host_header_ = url_.host + ':' + std::to_string(ep.port());

    if constexpr (k_is_tls) {
      beast::get_lowest_layer(ws_).expires_after(timeout_);

// Set SNI Hostname (many hosts need this to handshake successfully)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wold-style-cast"
      const bool set_tls_successful =
          SSL_set_tlsext_host_name(ws_.next_layer().native_handle(), url_.host.c_str());
#pragma GCC diagnostic pop
      if (!set_tls_successful) {
        ec = beast::error_code{static_cast<int>(::ERR_get_error()),
                               asio::error::get_ssl_category()};
        return fail_(TransportOperation::HANDSHAKE, ec);
      }
      ws_.next_layer().set_verify_callback(asio::ssl::host_name_verification{url_.host});

      ws_.next_layer().async_handshake(
          asio::ssl::stream_base::client,
          beast::bind_front_handler(&Connection::on_tls_handshake_, this->shared_from_this()));
    } else {
      websocket_handshake_();
    }
  }

  void on_tls_handshake_(beast::error_code ec) {
    if (ec)
      return fail_(TransportOperation::HANDSHAKE, ec);
    websocket_handshake_();
  }

  void websocket_handshake_() {
    // Turn off the timeout on the tcp_stream, because
    // the websocket stream has its own timeout system.
    beast::get_lowest_layer(ws_).expires_never();

    ws_.set_option(beast::websocket::stream_base::timeout::suggested(beast::role_type::client));
    ws_.set_option(beast::websocket::stream_base::decorator(
        [agent = user_agent_](beast::websocket::request_type& req) {
          req.set(beast::http::field::user_agent, agent);
        }));

    ws_.async_handshake(
        host_header_, url_.target,
        beast::bind_front_handler(&Connection::on_handshake_, this->shared_from_this()));
  }

  void on_handshake_(beast::error_code ec) {
    if (ec)
      return fail_(TransportOperation::HANDSHAKE, ec);

    ws_.text(true); // DDP is a text protocol
    is_open_.store(true, std::memory_order_release);
    slot_->notify([](TransportListener& listener) { listener.on_transport_open(); });

    do_read_();
  }

  void do_read_() {
    ws_.async_read(buffer_,
                   beast::bind_front_handler(&Connection::on_read_, this->shared_from_this()));
  }

  void on_read_(beast::error_code ec, std::size_t bytes_transferred) {
    boost::ignore_unused(bytes_transferred);

    // This indicates that the session was closed
    if (ec == beast::websocket::error::closed) {
      is_open_.store(false, std::memory_order_release);
      const auto& reason = ws_.reason();
      slot_->notify_close(static_cast<uint16_t>(reason.code),
                          std::string_view{reason.reason.data(), reason.reason.size()});
      return;
    }

    if (ec)
      return fail_(TransportOperation::READ, ec);

    const auto data = buffer_.cdata();
    const std::string_view text{static_cast<const char*>(data.data()), data.size()};
    slot_->notify([text](TransportListener& listener) { listener.on_transport_message(text); });

    buffer_.consume(buffer_.size()); // Clear the buffer
    do_read_();                      // Read another message
  }

  void do_write_() {
    ws_.async_write(asio::buffer(outbox_.front()),
                    beast::bind_front_handler(&Connection::on_write_, this->shared_from_this()));
  }

  void on_write_(beast::error_code ec, std::size_t bytes_transferred) {
    boost::ignore_unused(bytes_transferred);
    if (ec) {
      outbox_.clear();
      slot_->notify_error(TransportOperation::WRITE, ec);
      return; // The read loop reports the close
    }
    outbox_.pop_front();
    if (!outbox_.empty())
      do_write_();
  }
};

} // namespace ddp::net::detail

namespace ddp::net {

// ------------------------------------------------------------------------------------------- Pimpl

struct WebsocketTransport::Pimpl {
  asio::io_context& io_context;
  asio::ssl::context ssl_context{asio::ssl::context::tlsv12_client};
  Config config;

  mutable std::mutex padlock;
  std::shared_ptr<detail::ListenerSlot> slot = nullptr;
  std::shared_ptr<detail::ConnectionBase> connection = nullptr;

  Pimpl(asio::io_context& io_context_, Config config_)
      : io_context{io_context_}, config{std::move(config_)} {
    ssl_context.set_default_verify_paths();
    ssl_context.set_verify_mode(config.verify_peer ? asio::ssl::verify_peer
                                                   : asio::ssl::verify_none);
  }

  // Forget the current connection. The caller detaches the returned slot once the
  // padlock is released, since listener callbacks run under the slot's lock.
  std::shared_ptr<detail::ListenerSlot> drop_locked_() {
    if (slot)
      slot->cancel();
    if (connection)
      connection->close();
    connection = nullptr;
    return std::exchange(slot, nullptr);
  }
};

static void detach(std::shared_ptr<detail::ListenerSlot> slot) {
  if (slot)
    slot->detach();
}

// ------------------------------------------------------------------------------------ Construction

WebsocketTransport::WebsocketTransport(boost::asio::io_context& io_context, Config config)
    : pimpl_{std::make_unique<Pimpl>(io_context, std::move(config))} {}

WebsocketTransport::WebsocketTransport(boost::asio::io_context& io_context)
    : WebsocketTransport{io_context, Config{}} {}

WebsocketTransport::~WebsocketTransport() { disconnect(); }

// ----------------------------------------------------------------------------------------- connect

void WebsocketTransport::connect(std::string_view url, TransportListener& listener) {
  auto slot = std::make_shared<detail::ListenerSlot>(listener);

  const auto parsed = parse_websocket_url(url);
  if (!parsed) {
    std::shared_ptr<detail::ListenerSlot> old_slot;
    {
      std::lock_guard lock{pimpl_->padlock};
      old_slot = pimpl_->drop_locked_();
      pimpl_->slot = slot;
    }
    detach(std::move(old_slot));
    slot->notify_error(TransportOperation::CONNECT, parsed.error());
    slot->notify_close(detail::k_close_abnormal, parsed.error().message());
    return;
  }

  std::shared_ptr<detail::ConnectionBase> connection;
  if (parsed->is_secure) {
    connection = std::make_shared<detail::Connection<detail::TlsStream>>(
        slot, *parsed, pimpl_->config, pimpl_->io_context, pimpl_->ssl_context);
  } else {
    connection = std::make_shared<detail::Connection<detail::PlainStream>>(
        slot, *parsed, pimpl_->config, pimpl_->io_context);
  }

  std::shared_ptr<detail::ListenerSlot> old_slot;
  {
    std::lock_guard lock{pimpl_->padlock};
    old_slot = pimpl_->drop_locked_();
    pimpl_->slot = slot;
    pimpl_->connection = connection;
  }
  detach(std::move(old_slot));

  connection->start();
}

// -------------------------------------------------------------------------------------- disconnect

void WebsocketTransport::disconnect() {
  std::shared_ptr<detail::ListenerSlot> old_slot;
  {
    std::lock_guard lock{pimpl_->padlock};
    old_slot = pimpl_->drop_locked_();
  }
  detach(std::move(old_slot));
}

// --------------------------------------------------------------------------------------- send text

bool WebsocketTransport::send_text(std::string_view text) {
  std::lock_guard lock{pimpl_->padlock};
  if (pimpl_->connection == nullptr || !pimpl_->connection->is_open())
    return false;
  pimpl_->connection->send(std::string{text});
  return true;
}

// ----------------------------------------------------------------------------------------- is open

bool WebsocketTransport::is_open() const {
  std::lock_guard lock{pimpl_->padlock};
  return pimpl_->connection != nullptr && pimpl_->connection->is_open();
}

} // namespace ddp::net
