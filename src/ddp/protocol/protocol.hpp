#pragma once

#include <range/v3/algorithm/find.hpp>

#include <array>
#include <string_view>

/**
 * @defgroup protocol Protocol
 * @ingroup ddp
 *
 * Names and constants of the DDP wire protocol.
 *
 * @see https://github.com/meteor/meteor/blob/devel/packages/ddp/DDP.md
 */

namespace ddp::protocol {

/**
 * @ingroup protocol
 * @brief Protocol versions the client speaks, in order of preference.
 */
constexpr std::array<std::string_view, 3> k_supported_versions = {"1", "pre2", "pre1"};

/**
 * @ingroup protocol
 * @brief true iff `version` is one of `k_supported_versions`.
 */
inline bool is_version_supported(std::string_view version) {
  return ranges::find(k_supported_versions, version) != k_supported_versions.end();
}

namespace field {
constexpr std::string_view k_message = "msg";
constexpr std::string_view k_version = "version";
constexpr std::string_view k_support = "support";
constexpr std::string_view k_session = "session";
constexpr std::string_view k_id = "id";
constexpr std::string_view k_method = "method";
constexpr std::string_view k_params = "params";
constexpr std::string_view k_random_seed = "randomSeed";
constexpr std::string_view k_name = "name";
constexpr std::string_view k_collection = "collection";
constexpr std::string_view k_fields = "fields";
constexpr std::string_view k_cleared = "cleared";
constexpr std::string_view k_before = "before";
constexpr std::string_view k_result = "result";
constexpr std::string_view k_error = "error";
constexpr std::string_view k_reason = "reason";
constexpr std::string_view k_details = "details";
constexpr std::string_view k_subs = "subs";
constexpr std::string_view k_offending_message = "offendingMessage";
constexpr std::string_view k_document_id = "_id"; //!< Mongo's primary key, used by `remove`
} // namespace field

namespace message {
// client -> server
constexpr std::string_view k_connect = "connect";
constexpr std::string_view k_method = "method";
constexpr std::string_view k_sub = "sub";
constexpr std::string_view k_unsub = "unsub";
constexpr std::string_view k_pong = "pong";
// server -> client
constexpr std::string_view k_connected = "connected";
constexpr std::string_view k_failed = "failed";
constexpr std::string_view k_ping = "ping";
constexpr std::string_view k_added = "added";
constexpr std::string_view k_added_before = "addedBefore";
constexpr std::string_view k_changed = "changed";
constexpr std::string_view k_removed = "removed";
constexpr std::string_view k_result = "result";
constexpr std::string_view k_ready = "ready";
constexpr std::string_view k_nosub = "nosub";
constexpr std::string_view k_error = "error";
} // namespace message

/**
 * @ingroup protocol
 * @brief The kinds of frame a server sends.
 */
enum class MessageKind : int {
  CONNECTED,
  FAILED,
  PING,
  ADDED,
  ADDED_BEFORE,
  CHANGED,
  REMOVED,
  RESULT,
  READY,
  NOSUB,
  SERVER_ERROR,
  UNKNOWN
};

constexpr std::string_view str(MessageKind kind) {
  switch (kind) {
  case MessageKind::CONNECTED:
    return message::k_connected;
  case MessageKind::FAILED:
    return message::k_failed;
  case MessageKind::PING:
    return message::k_ping;
  case MessageKind::ADDED:
    return message::k_added;
  case MessageKind::ADDED_BEFORE:
    return message::k_added_before;
  case MessageKind::CHANGED:
    return message::k_changed;
  case MessageKind::REMOVED:
    return message::k_removed;
  case MessageKind::RESULT:
    return message::k_result;
  case MessageKind::READY:
    return message::k_ready;
  case MessageKind::NOSUB:
    return message::k_nosub;
  case MessageKind::SERVER_ERROR:
    return message::k_error;
  case MessageKind::UNKNOWN:
    break;
  }
  return "<unknown>";
}

/**
 * @ingroup protocol
 * @brief Classify the `msg` discriminator of an inbound frame.
 */
constexpr MessageKind to_message_kind(std::string_view msg) {
  constexpr std::array<MessageKind, 11> k_kinds = {
      MessageKind::CONNECTED, MessageKind::FAILED,  MessageKind::PING,
      MessageKind::ADDED,     MessageKind::ADDED_BEFORE, MessageKind::CHANGED,
      MessageKind::REMOVED,   MessageKind::RESULT,  MessageKind::READY,
      MessageKind::NOSUB,     MessageKind::SERVER_ERROR};
  for (const auto kind : k_kinds)
    if (str(kind) == msg)
      return kind;
  return MessageKind::UNKNOWN;
}

} // namespace ddp::protocol
