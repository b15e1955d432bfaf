#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace ddp {

enum class ConnectionState : int {
  DISCONNECTED,       // No transport, or given up
  CONNECTING,         // Waiting for the transport to open
  AWAITING_HANDSHAKE, // Transport open, `connect` frame sent
  CONNECTED           // Server answered `connected`
};

constexpr std::string_view str(ConnectionState state) {
#define CASE(x)                                                                                    \
  case ConnectionState::x:                                                                         \
    return #x
  switch (state) {
    CASE(DISCONNECTED);
    CASE(CONNECTING);
    CASE(AWAITING_HANDSHAKE);
    CASE(CONNECTED);
  }
#undef CASE
  return "<unknown case>";
}

/**
 * @ingroup client
 * @brief Everything the client knows about its session with the server.
 *
 * Owned by `DdpClient`, and only touched with the client's lock held.
 */
struct SessionState {
  std::string url;
  std::string version;                   //!< Negotiated protocol version
  std::optional<std::string> session_id; //!< Assigned by the server on `connected`
  ConnectionState state = ConnectionState::DISCONNECTED;
  bool reconnecting = false; //!< The current connect attempt follows a lost session
  uint32_t attempts = 0;     //!< Consecutive reconnect attempts
  uint32_t negotiations = 0; //!< `failed` replies since the last `connected`

  bool is_open() const {
    return state == ConnectionState::AWAITING_HANDSHAKE || state == ConnectionState::CONNECTED;
  }

  //! Back to square one; the url and version are kept
  void reset() {
    session_id.reset();
    state = ConnectionState::DISCONNECTED;
    reconnecting = false;
    attempts = 0;
    negotiations = 0;
  }
};

} // namespace ddp
