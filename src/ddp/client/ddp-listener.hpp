#pragma once

#include <cstdint>
#include <string_view>
#include <system_error>

namespace ddp {

/**
 * @ingroup client
 * @brief Application callbacks of a `DdpClient`. Override what you need.
 *
 * Callbacks run on the thread that delivered the triggering transport event,
 * with no client lock held, so they may call back into the client. They must
 * not throw. String arguments are only valid for the duration of the call.
 */
class DdpListener {
public:
  virtual ~DdpListener() = default;

  /// The server accepted the handshake. Called again after every successful reconnect.
  virtual void on_connect() {}

  /// The session is gone for good, until `DdpClient::reconnect`.
  virtual void on_disconnect(uint16_t code, std::string_view reason) {}

  /// Transport failures, malformed frames, and protocol faults.
  virtual void on_exception(std::error_code ec, std::string_view what) {}

  /**
   * @param fields Raw json of the document's fields; empty if the server sent none.
   */
  virtual void on_data_added(std::string_view collection, std::string_view id,
                             std::string_view fields) {}

  /**
   * @param fields Raw json of the changed fields; empty if the server sent none.
   * @param cleared Raw json array of removed field names; empty if the server sent none.
   */
  virtual void on_data_changed(std::string_view collection, std::string_view id,
                               std::string_view fields, std::string_view cleared) {}

  virtual void on_data_removed(std::string_view collection, std::string_view id) {}
};

} // namespace ddp
