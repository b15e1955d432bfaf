#pragma once

#include "protocol.hpp"
#include "status.hpp"

#include "ddp/utils/base-include.hpp"

#include <json/json.h>

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace ddp::protocol {

// ---------------------------------------------------------------------------------------- Outbound

/**
 * @brief Handshake: `{msg: "connect", version, support, session?}`
 * @param session The previous session id, when resuming a session.
 */
Json::Value make_connect_frame(std::string_view version, const std::optional<std::string>& session);

/**
 * @brief Method invocation: `{msg: "method", method, id, params?, randomSeed?}`
 * @param params Must be null (omitted) or an array.
 */
Json::Value make_method_frame(std::string_view method, std::string_view id,
                              const Json::Value& params,
                              const std::optional<std::string>& random_seed);

/**
 * @brief Subscription: `{msg: "sub", name, id, params?}`
 * @param params Must be null (omitted) or an array.
 */
Json::Value make_sub_frame(std::string_view name, std::string_view id, const Json::Value& params);

/**
 * @brief `{msg: "unsub", id}`
 */
Json::Value make_unsub_frame(std::string_view id);

/**
 * @brief Reply to a `ping`: `{msg: "pong", id?}`
 */
Json::Value make_pong_frame(const std::optional<std::string>& id);

/**
 * @brief Serialize a frame for the wire, as compact json.
 * Fails with `ecode::malformed_frame` if the writer rejects the frame.
 */
expected<std::string, std::error_code> serialize_frame(const Json::Value& frame);

/**
 * @brief Parse json text, in strict mode. Fails with `ecode::malformed_frame`.
 */
expected<Json::Value, std::error_code> parse_json(std::string_view text);

/**
 * @brief Compact json text of `value`, as passed on to handlers and listeners.
 */
std::string to_json_text(const Json::Value& value);

// ----------------------------------------------------------------------------------------- Inbound

struct ConnectedMessage {
  std::optional<std::string> session;
};

struct FailedMessage {
  std::optional<std::string> version; //!< The version the server would like to speak
};

struct PingMessage {
  std::optional<std::string> id;
};

/**
 * `added` and `addedBefore`. Json payloads are passed on raw.
 */
struct AddedMessage {
  std::string collection;
  std::string id;
  std::optional<std::string> fields;
  std::optional<std::string> before; //!< Only set for `addedBefore`
};

struct ChangedMessage {
  std::string collection;
  std::string id;
  std::optional<std::string> fields;
  std::optional<std::string> cleared;
};

struct RemovedMessage {
  std::string collection;
  std::string id;
};

struct ResultMessage {
  std::string id;
  std::optional<std::string> result; //!< Raw json
  std::optional<Status> error;       //!< StatusCode::METHOD_ERROR
};

struct ReadyMessage {
  std::vector<std::string> subs;
};

struct NoSubMessage {
  std::string id;
  std::optional<Status> error; //!< StatusCode::SUBSCRIPTION_ERROR
};

struct ServerErrorMessage {
  std::string reason;
  std::optional<std::string> offending_message; //!< Raw json
};

/**
 * A frame with a missing or unrecognized `msg`.
 */
struct IgnoredMessage {
  std::string msg;
};

using InboundMessage =
    std::variant<IgnoredMessage, ConnectedMessage, FailedMessage, PingMessage, AddedMessage,
                 ChangedMessage, RemovedMessage, ResultMessage, ReadyMessage, NoSubMessage,
                 ServerErrorMessage>;

/**
 * @brief Decode a text frame received from the server.
 *
 * Fails with `ecode::malformed_frame` when the payload is not a json object,
 * or when a known field has the wrong type. A missing or unknown `msg` is not
 * a failure, and results in an `IgnoredMessage`.
 */
expected<InboundMessage, std::error_code> decode_frame(std::string_view payload);

} // namespace ddp::protocol
