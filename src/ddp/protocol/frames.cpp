#include "frames.hpp"

#include "ddp/utils/error-codes.hpp"

namespace ddp::protocol {

namespace {
void set(Json::Value& frame, std::string_view key, std::string_view value) {
  frame[std::string{key}] = Json::Value{value.data(), value.data() + value.size()};
}

const Json::StreamWriterBuilder& compact_writer() {
  static const Json::StreamWriterBuilder builder = []() {
    Json::StreamWriterBuilder b;
    b["indentation"] = "";
    b["emitUTF8"] = true;
    return b;
  }();
  return builder;
}

Json::CharReader& strict_reader() {
  thread_local std::unique_ptr<Json::CharReader> reader = []() {
    Json::CharReaderBuilder builder;
    Json::CharReaderBuilder::strictMode(&builder.settings_);
    return std::unique_ptr<Json::CharReader>{builder.newCharReader()};
  }();
  return *reader;
}
} // namespace

// ---------------------------------------------------------------------------------------- Encoders

Json::Value make_connect_frame(std::string_view version,
                               const std::optional<std::string>& session) {
  Json::Value frame{Json::objectValue};
  set(frame, field::k_message, message::k_connect);
  set(frame, field::k_version, version);

  Json::Value support{Json::arrayValue};
  for (const auto supported : k_supported_versions)
    support.append(std::string{supported});
  frame[std::string{field::k_support}] = std::move(support);

  if (session)
    set(frame, field::k_session, *session);
  return frame;
}

Json::Value make_method_frame(std::string_view method, std::string_view id,
                              const Json::Value& params,
                              const std::optional<std::string>& random_seed) {
  Expects(params.isNull() || params.isArray());
  Json::Value frame{Json::objectValue};
  set(frame, field::k_message, message::k_method);
  set(frame, field::k_method, method);
  set(frame, field::k_id, id);
  if (!params.isNull())
    frame[std::string{field::k_params}] = params;
  if (random_seed)
    set(frame, field::k_random_seed, *random_seed);
  return frame;
}

Json::Value make_sub_frame(std::string_view name, std::string_view id, const Json::Value& params) {
  Expects(params.isNull() || params.isArray());
  Json::Value frame{Json::objectValue};
  set(frame, field::k_message, message::k_sub);
  set(frame, field::k_name, name);
  set(frame, field::k_id, id);
  if (!params.isNull())
    frame[std::string{field::k_params}] = params;
  return frame;
}

Json::Value make_unsub_frame(std::string_view id) {
  Json::Value frame{Json::objectValue};
  set(frame, field::k_message, message::k_unsub);
  set(frame, field::k_id, id);
  return frame;
}

Json::Value make_pong_frame(const std::optional<std::string>& id) {
  Json::Value frame{Json::objectValue};
  set(frame, field::k_message, message::k_pong);
  if (id)
    set(frame, field::k_id, *id);
  return frame;
}

std::string to_json_text(const Json::Value& value) {
  return Json::writeString(compact_writer(), value);
}

expected<std::string, std::error_code> serialize_frame(const Json::Value& frame) {
  try {
    return to_json_text(frame);
  } catch (const Json::Exception& e) {
    LOG_ERR("failed to serialize frame: {}", e.what());
    return make_unexpected(make_error_code(ecode::malformed_frame));
  }
}

// ---------------------------------------------------------------------------------------- Decoders

expected<Json::Value, std::error_code> parse_json(std::string_view text) {
  Json::Value value;
  std::string errors;
  try {
    if (!strict_reader().parse(text.data(), text.data() + text.size(), &value, &errors)) {
      TRACE("failed to parse json: {}", errors);
      return make_unexpected(make_error_code(ecode::malformed_frame));
    }
  } catch (const Json::Exception& e) {
    // The reader throws, rather than failing, past its nesting limit
    TRACE("failed to parse json: {}", e.what());
    return make_unexpected(make_error_code(ecode::malformed_frame));
  }
  return value;
}

namespace {
/**
 * @private
 * @brief Reads optional fields out of a decoded frame, remembering any type error.
 */
class FieldReader {
private:
  const Json::Value& frame_;
  bool ok_{true};

  const Json::Value* find_(std::string_view key) const {
    return frame_.find(key.data(), key.data() + key.size());
  }

public:
  explicit FieldReader(const Json::Value& frame) : frame_{frame} {}

  bool ok() const { return ok_; }

  /// A string field; absent and `null` both read as `nullopt`
  std::optional<std::string> text(std::string_view key) {
    const auto* value = find_(key);
    if (value == nullptr || value->isNull())
      return std::nullopt;
    if (!value->isString()) {
      ok_ = false;
      return std::nullopt;
    }
    return value->asString();
  }

  /// A sub-document of any type, passed on as raw json
  std::optional<std::string> raw(std::string_view key) {
    const auto* value = find_(key);
    if (value == nullptr)
      return std::nullopt;
    return to_json_text(*value);
  }

  std::vector<std::string> text_array(std::string_view key) {
    std::vector<std::string> out;
    const auto* value = find_(key);
    if (value == nullptr || value->isNull())
      return out;
    if (!value->isArray()) {
      ok_ = false;
      return out;
    }
    out.reserve(value->size());
    for (const auto& element : *value) {
      if (!element.isString()) {
        ok_ = false;
        return {};
      }
      out.push_back(element.asString());
    }
    return out;
  }

  /// `{error, reason, details}`
  std::optional<Status> error(StatusCode code) {
    const auto* payload = find_(field::k_error);
    if (payload == nullptr || payload->isNull())
      return std::nullopt;
    if (!payload->isObject()) {
      ok_ = false;
      return std::nullopt;
    }

    auto as_text = [payload](std::string_view key) -> std::string {
      const auto* value = payload->find(key.data(), key.data() + key.size());
      if (value == nullptr || value->isNull())
        return {};
      if (value->isString())
        return value->asString();
      return to_json_text(*value);
    };

    return Status{code, as_text(field::k_error), as_text(field::k_reason),
                  as_text(field::k_details)};
  }
};
} // namespace

expected<InboundMessage, std::error_code> decode_frame(std::string_view payload) {
  auto parsed = parse_json(payload);
  if (!parsed)
    return make_unexpected(parsed.error());
  if (!parsed->isObject())
    return make_unexpected(make_error_code(ecode::malformed_frame));

  const Json::Value& frame = *parsed;
  FieldReader reader{frame};

  const auto msg = reader.text(field::k_message);
  if (!msg)
    return InboundMessage{IgnoredMessage{}};

  InboundMessage message;
  switch (to_message_kind(*msg)) {
  case MessageKind::CONNECTED:
    message = ConnectedMessage{reader.text(field::k_session)};
    break;
  case MessageKind::FAILED:
    message = FailedMessage{reader.text(field::k_version)};
    break;
  case MessageKind::PING:
    message = PingMessage{reader.text(field::k_id)};
    break;
  case MessageKind::ADDED:
  case MessageKind::ADDED_BEFORE: {
    AddedMessage added;
    added.collection = reader.text(field::k_collection).value_or("");
    added.id = reader.text(field::k_id).value_or("");
    added.fields = reader.raw(field::k_fields);
    added.before = reader.raw(field::k_before);
    message = std::move(added);
  } break;
  case MessageKind::CHANGED: {
    ChangedMessage changed;
    changed.collection = reader.text(field::k_collection).value_or("");
    changed.id = reader.text(field::k_id).value_or("");
    changed.fields = reader.raw(field::k_fields);
    changed.cleared = reader.raw(field::k_cleared);
    message = std::move(changed);
  } break;
  case MessageKind::REMOVED:
    message = RemovedMessage{reader.text(field::k_collection).value_or(""),
                             reader.text(field::k_id).value_or("")};
    break;
  case MessageKind::RESULT: {
    ResultMessage result;
    result.id = reader.text(field::k_id).value_or("");
    result.result = reader.raw(field::k_result);
    result.error = reader.error(StatusCode::METHOD_ERROR);
    message = std::move(result);
  } break;
  case MessageKind::READY:
    message = ReadyMessage{reader.text_array(field::k_subs)};
    break;
  case MessageKind::NOSUB:
    message = NoSubMessage{reader.text(field::k_id).value_or(""),
                           reader.error(StatusCode::SUBSCRIPTION_ERROR)};
    break;
  case MessageKind::SERVER_ERROR:
    message = ServerErrorMessage{reader.text(field::k_reason).value_or(""),
                                 reader.raw(field::k_offending_message)};
    break;
  case MessageKind::UNKNOWN:
    message = IgnoredMessage{*msg};
    break;
  }

  if (!reader.ok())
    return make_unexpected(make_error_code(ecode::malformed_frame));
  return message;
}

} // namespace ddp::protocol
