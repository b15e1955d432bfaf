#pragma once

#include <cstdint>
#include <string_view>
#include <system_error>

namespace ddp::net {

enum class TransportOperation : int {
  CONNECT,   // Resolving and connecting to the server
  HANDSHAKE, // TLS or websocket handshake
  READ,      // During read operation
  WRITE,     // During a write operation
  CLOSE      // The channel is being closed
};

constexpr std::string_view str(TransportOperation op) {
#define CASE(x)                                                                                    \
  case TransportOperation::x:                                                                      \
    return #x
  switch (op) {
    CASE(CONNECT);
    CASE(HANDSHAKE);
    CASE(READ);
    CASE(WRITE);
    CASE(CLOSE);
  }
#undef CASE
  return "<unknown case>";
}

// ------------------------------------------------------------------------------- TransportListener

/**
 * @brief Receives the events of a `Transport`.
 * @note Events may be delivered on any thread, but never concurrently for one connection.
 */
class TransportListener {
public:
  virtual ~TransportListener() = default;

  /**
   * @brief The channel is open, and `send_text` will now deliver.
   */
  virtual void on_transport_open() = 0;

  /**
   * @brief The channel closed, or failed to open.
   *
   * Reported exactly once for every `connect` that is not ended by the client
   * itself (i.e., by `disconnect`, or by a subsequent `connect`).
   */
  virtual void on_transport_close(uint16_t code, std::string_view reason) = 0;

  /**
   * @brief A text message from the server.
   * The memory behind `text` is reused once this returns.
   */
  virtual void on_transport_message(std::string_view text) = 0;

  /**
   * @brief Something went wrong; `on_transport_close` follows for failures that end the channel.
   */
  virtual void on_transport_error(TransportOperation operation, std::error_code ec) = 0;
};

// --------------------------------------------------------------------------------------- Transport

/**
 * @brief A full-duplex text channel to a server.
 *
 * A transport serves one connection at a time. Calling `connect` again drops
 * the current connection without reporting its close.
 */
class Transport {
public:
  virtual ~Transport() = default;

  /**
   * @brief Start connecting to `url`; the outcome is reported to `listener`.
   * @note `listener` must outlive the connection, or until `disconnect` is called.
   */
  virtual void connect(std::string_view url, TransportListener& listener) = 0;

  /**
   * @brief Close the current connection. No further events are reported for it.
   */
  virtual void disconnect() = 0;

  /**
   * @brief Queue `text` for delivery.
   * @return false if there is no open connection.
   * @note Must not call back into the listener before returning.
   */
  virtual bool send_text(std::string_view text) = 0;

  /**
   * @brief true iff a connection is open.
   */
  virtual bool is_open() const = 0;
};

} // namespace ddp::net
