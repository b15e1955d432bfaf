#pragma once

#include "ddp-listener.hpp"
#include "outbound-queue.hpp"
#include "pending-requests.hpp"
#include "session-state.hpp"

#include "ddp/net/transport.hpp"
#include "ddp/protocol/frames.hpp"
#include "ddp/utils.hpp"

#include <mutex>
#include <span>

/**
 * @defgroup client Client
 * @ingroup ddp
 *
 * A DDP client: method calls, subscriptions, and the data they publish.
 *
 * @include ddp-client_ex.cpp
 */

namespace ddp {

/**
 * @ingroup client
 * @brief Semantic version of this library.
 */
constexpr std::string_view k_library_version = "0.1.0";

// -------------------------------------------------------------------------------------- DdpClient

/**
 * @ingroup client
 * @brief A client session with a DDP server (e.g., Meteor).
 *
 * The client connects on construction, and reconnects on its own when a live
 * session is lost. Requests made while the session is down are queued, and sent
 * in order once the server accepts the handshake. Replies are delivered to the
 * handler passed with the request; data changes go to the `DdpListener`.
 *
 * Threadsafe. Handlers and listener callbacks run on the thread that delivered
 * the transport event, with no client lock held.
 */
class DdpClient final : private net::TransportListener {
public:
  struct Config {
    string url;                          //!< `ws://` or `wss://` address of the server
    string protocol_version = "1";       //!< Preferred version, one of `supported_versions()`
    uint32_t max_reconnect_attempts = 5; //!< Consecutive failed attempts before giving up
  };

private:
  Config config_;
  unique_ptr<net::Transport> transport_;

  mutable std::mutex padlock_; //!< Protects `session_` and `listener_`
  std::mutex write_padlock_;   //!< Orders sends: the queue flush comes before later sends
  SessionState session_;
  shared_ptr<DdpListener> listener_;

  PendingRequests pending_;
  OutboundQueue outbound_;

public:
  /**
   * Exceptions
   * + std::invalid_argument if `config.protocol_version` is not supported
   */
  DdpClient(Config config, unique_ptr<net::Transport> transport,
            shared_ptr<DdpListener> listener = nullptr);
  DdpClient(const DdpClient&) = delete;
  DdpClient(DdpClient&&) = delete;
  ~DdpClient() override;
  DdpClient& operator=(const DdpClient&) = delete;
  DdpClient& operator=(DdpClient&&) = delete;

  static bool is_version_supported(std::string_view version) {
    return protocol::is_version_supported(version);
  }
  static std::span<const std::string_view> supported_versions() {
    return protocol::k_supported_versions;
  }

  // ------------------------------------------------------------------------------------- Session

  /**
   * @brief Open the session again, e.g., after giving up on reconnecting.
   * If the transport is still open, the handshake is resent instead.
   */
  void reconnect();

  /**
   * @brief Close the session. Pending handlers and queued frames are dropped without
   *        being sent or called, and the listener is detached.
   */
  void disconnect();

  void set_listener(shared_ptr<DdpListener> listener);

  bool is_connected() const;
  ConnectionState state() const;
  std::optional<string> session_id() const;
  string protocol_version() const;
  uint32_t reconnect_attempts() const;
  std::size_t pending_count() const { return pending_.size(); }
  std::size_t queued_count() const { return outbound_.size(); }

  // ------------------------------------------------------------------------------------ Requests

  /**
   * @brief Call a server method.
   * @param params `null` to omit, otherwise an array.
   * @param handler Optional; without one the reply is ignored.
   */
  void call(std::string_view method, const Json::Value& params = Json::Value{},
            ResultHandler handler = {});

  /**
   * @brief Call a server method, passing a seed for the ids of documents it creates.
   */
  void call_with_seed(std::string_view method, const std::optional<string>& random_seed,
                      const Json::Value& params = Json::Value{}, ResultHandler handler = {});

  /**
   * @brief Subscribe to a publication.
   * @return The subscription id, for `unsubscribe`.
   */
  string subscribe(std::string_view name, const Json::Value& params = Json::Value{},
                   SubscribeHandler handler = {});

  void unsubscribe(std::string_view subscription_id, UnsubscribeHandler handler = {});

  /// Calls `/<collection>/insert` with `[document]`
  void insert(std::string_view collection, const Json::Value& document,
              ResultHandler handler = {});

  /// Calls `/<collection>/update` with `[selector, modifier, options]`
  void update(std::string_view collection, const Json::Value& selector,
              const Json::Value& modifier,
              const Json::Value& options = Json::Value{Json::objectValue},
              ResultHandler handler = {});

  /// Calls `/<collection>/remove` with `[{"_id": document_id}]`
  void remove(std::string_view collection, std::string_view document_id,
              ResultHandler handler = {});

private:
  void open_(bool reconnecting);
  void send_handshake_();
  bool send_(const Json::Value& frame);
  void flush_locked_();
  void give_up_(uint16_t code, std::string_view reason);
  void fail_version_(std::string_view version);
  shared_ptr<DdpListener> listener_copy_() const;

  void on_transport_open() override;
  void on_transport_close(uint16_t code, std::string_view reason) override;
  void on_transport_message(std::string_view text) override;
  void on_transport_error(net::TransportOperation operation, std::error_code ec) override;

  void handle_(const protocol::IgnoredMessage& msg);
  void handle_(const protocol::ConnectedMessage& msg);
  void handle_(const protocol::FailedMessage& msg);
  void handle_(const protocol::PingMessage& msg);
  void handle_(const protocol::AddedMessage& msg);
  void handle_(const protocol::ChangedMessage& msg);
  void handle_(const protocol::RemovedMessage& msg);
  void handle_(const protocol::ResultMessage& msg);
  void handle_(const protocol::ReadyMessage& msg);
  void handle_(const protocol::NoSubMessage& msg);
  void handle_(const protocol::ServerErrorMessage& msg);
};

} // namespace ddp
