#include "ddp-client.hpp"

#include <initializer_list>
#include <stdexcept>

namespace ddp {

namespace {
Json::Value array_of(std::initializer_list<Json::Value> elements) {
  Json::Value array{Json::arrayValue};
  for (const auto& element : elements)
    array.append(element);
  return array;
}

//! Close code reported when the server insists on a protocol version we do not speak
constexpr uint16_t k_close_protocol_error = 1002;
} // namespace

// ------------------------------------------------------------------------------------ Construction

DdpClient::DdpClient(Config config, unique_ptr<net::Transport> transport,
                     shared_ptr<DdpListener> listener)
    : config_{std::move(config)}, transport_{std::move(transport)},
      listener_{std::move(listener)} {
  if (!is_version_supported(config_.protocol_version))
    throw std::invalid_argument(
        format("DDP protocol version not supported: '{}'", config_.protocol_version));
  Expects(transport_ != nullptr);

  session_.url = config_.url;
  session_.version = config_.protocol_version;
  open_(false);
}

DdpClient::~DdpClient() { disconnect(); }

// ----------------------------------------------------------------------------------------- Session

void DdpClient::reconnect() { open_(false); }

void DdpClient::disconnect() {
  {
    std::lock_guard lock{padlock_};
    session_.reset();
    listener_ = nullptr;
  }
  const auto dropped = pending_.clear();
  outbound_.clear();
  if (dropped > 0)
    LOG_DEBUG("disconnect dropped {} pending requests", dropped);
  transport_->disconnect();
}

void DdpClient::set_listener(shared_ptr<DdpListener> listener) {
  std::lock_guard lock{padlock_};
  listener_ = std::move(listener);
}

bool DdpClient::is_connected() const { return state() == ConnectionState::CONNECTED; }

ConnectionState DdpClient::state() const {
  std::lock_guard lock{padlock_};
  return session_.state;
}

std::optional<string> DdpClient::session_id() const {
  std::lock_guard lock{padlock_};
  return session_.session_id;
}

string DdpClient::protocol_version() const {
  std::lock_guard lock{padlock_};
  return session_.version;
}

uint32_t DdpClient::reconnect_attempts() const {
  std::lock_guard lock{padlock_};
  return session_.attempts;
}

shared_ptr<DdpListener> DdpClient::listener_copy_() const {
  std::lock_guard lock{padlock_};
  return listener_;
}

// ------------------------------------------------------------------------------------------- open_

void DdpClient::open_(bool reconnecting) {
  const bool transport_open = transport_->is_open();
  string url;
  {
    std::lock_guard lock{padlock_};
    session_.reconnecting = reconnecting;
    session_.state =
        transport_open ? ConnectionState::AWAITING_HANDSHAKE : ConnectionState::CONNECTING;
    url = session_.url;
  }

  if (transport_open) {
    send_handshake_();
  } else {
    LOG_DEBUG("connecting to {}{}", url, (reconnecting ? " (reconnecting)" : ""));
    transport_->connect(url, *this);
  }
}

void DdpClient::send_handshake_() {
  Json::Value frame;
  {
    std::lock_guard lock{padlock_};
    frame = protocol::make_connect_frame(session_.version, session_.session_id);
  }

  auto text = protocol::serialize_frame(frame);
  bool sent = false;
  if (text) {
    std::lock_guard lock{write_padlock_};
    sent = transport_->send_text(*text);
    if (sent)
      TRACE("SEND {}", *text);
  }

  if (!sent) {
    const auto ec = text ? make_error_code(ecode::not_connected) : text.error();
    WARN("failed to send handshake: {}", ec.message());
    if (auto listener = listener_copy_())
      listener->on_exception(ec, "failed to send handshake");
  }
}

// ------------------------------------------------------------------------------------------- send_

bool DdpClient::send_(const Json::Value& frame) {
  auto text = protocol::serialize_frame(frame);
  if (!text) {
    if (auto listener = listener_copy_())
      listener->on_exception(text.error(), "failed to encode outbound frame");
    return false;
  }

  std::lock_guard lock{write_padlock_};
  if (state() == ConnectionState::CONNECTED && transport_->send_text(*text)) {
    TRACE("SEND {}", *text);
    return true;
  }
  TRACE("QUEUE {}", *text);
  outbound_.push(std::move(*text));
  return true;
}

// Caller holds `write_padlock_`
void DdpClient::flush_locked_() {
  auto frames = outbound_.drain();
  while (!frames.empty()) {
    if (!transport_->send_text(frames.front()))
      break;
    TRACE("SEND {}", frames.front());
    frames.pop_front();
  }

  // The transport went away mid-flush. The queue is empty, so order is kept.
  if (!frames.empty()) {
    WARN("transport closed while flushing, {} frames stay queued", frames.size());
    for (auto& text : frames)
      outbound_.push(std::move(text));
  }
}

// -------------------------------------------------------------------------------------- Teardowns

void DdpClient::give_up_(uint16_t code, std::string_view reason) {
  shared_ptr<DdpListener> listener;
  {
    std::lock_guard lock{padlock_};
    session_.reset();
    listener = listener_;
  }
  const auto dropped = pending_.clear();
  WARN("giving up after {} reconnect attempts, dropped {} pending requests",
       config_.max_reconnect_attempts, dropped);

  if (listener) {
    listener->on_exception(
        make_error_code(ecode::reconnect_exhausted),
        format("gave up after {} reconnect attempts", config_.max_reconnect_attempts));
    listener->on_disconnect(code, reason);
  }
}

void DdpClient::fail_version_(std::string_view version) {
  shared_ptr<DdpListener> listener;
  {
    std::lock_guard lock{padlock_};
    session_.reset();
    listener = listener_;
  }
  pending_.clear();
  outbound_.clear();
  transport_->disconnect();

  LOG_ERR("server requires unsupported protocol version '{}'", version);
  if (listener) {
    listener->on_exception(make_error_code(ecode::unsupported_version),
                           format("server requires protocol version '{}'", version));
    listener->on_disconnect(k_close_protocol_error, "unsupported protocol version");
  }
}

// ------------------------------------------------------------------------------ Transport events

void DdpClient::on_transport_open() {
  {
    std::lock_guard lock{padlock_};
    session_.attempts = 0;
    session_.state = ConnectionState::AWAITING_HANDSHAKE;
  }
  send_handshake_();
}

void DdpClient::on_transport_close(uint16_t code, std::string_view reason) {
  enum class Next { IGNORE, RECONNECT, GIVE_UP, REPORT };

  Next next = Next::IGNORE;
  string url;
  shared_ptr<DdpListener> listener;
  {
    std::lock_guard lock{padlock_};
    url = session_.url;
    listener = listener_;
    const bool lost_session = session_.is_open();
    const bool failed_attempt =
        session_.state == ConnectionState::CONNECTING && session_.reconnecting;
    if (lost_session || failed_attempt) {
      ++session_.attempts;
      if (session_.attempts <= config_.max_reconnect_attempts) {
        session_.state = ConnectionState::CONNECTING;
        session_.reconnecting = true;
        next = Next::RECONNECT;
      } else {
        next = Next::GIVE_UP;
      }
    } else if (session_.state == ConnectionState::CONNECTING) {
      session_.state = ConnectionState::DISCONNECTED;
      next = Next::REPORT;
    }
  }

  switch (next) {
  case Next::IGNORE:
    TRACE("ignoring close, code={}, reason='{}'", code, reason);
    break;
  case Next::RECONNECT:
    INFO("connection closed (code={}, reason='{}'), reconnecting", code, reason);
    transport_->connect(url, *this);
    break;
  case Next::GIVE_UP:
    give_up_(code, reason);
    break;
  case Next::REPORT:
    WARN("failed to connect to {}, code={}, reason='{}'", url, code, reason);
    if (listener)
      listener->on_disconnect(code, reason);
    break;
  }
}

void DdpClient::on_transport_message(std::string_view text) {
  TRACE("RECEIVE {}", text);

  auto decoded = protocol::decode_frame(text);
  if (!decoded) {
    WARN("dropping malformed frame: {}", text);
    if (auto listener = listener_copy_())
      listener->on_exception(decoded.error(), format("dropping malformed frame: {}", text));
    return;
  }

  std::visit([this](const auto& msg) { handle_(msg); }, *decoded);
}

void DdpClient::on_transport_error(net::TransportOperation operation, std::error_code ec) {
  WARN("transport error on op={}: {}", str(operation), ec.message());
  if (auto listener = listener_copy_())
    listener->on_exception(ec, format("{}: {}", str(operation), ec.message()));
}

// ------------------------------------------------------------------------------ Session messages

void DdpClient::handle_(const protocol::IgnoredMessage& msg) {
  TRACE("ignoring message, msg='{}'", msg.msg);
}

void DdpClient::handle_(const protocol::ConnectedMessage& msg) {
  shared_ptr<DdpListener> listener;
  {
    std::lock_guard wlock{write_padlock_};
    {
      std::lock_guard lock{padlock_};
      if (session_.state != ConnectionState::AWAITING_HANDSHAKE) {
        WARN("unexpected 'connected' in state {}", str(session_.state));
        return;
      }
      if (msg.session)
        session_.session_id = msg.session;
      session_.state = ConnectionState::CONNECTED;
      session_.reconnecting = false;
      session_.attempts = 0;
      session_.negotiations = 0;
      listener = listener_;
    }
    flush_locked_();
  }

  INFO("connected, session={}", msg.session.value_or("<none>"));
  if (listener)
    listener->on_connect();
}

void DdpClient::handle_(const protocol::FailedMessage& msg) {
  if (!msg.version) {
    WARN("ignoring 'failed' without a proposed version");
    return;
  }
  const auto& proposed = *msg.version;

  bool adopted = false;
  string url;
  {
    std::lock_guard lock{padlock_};
    // Negotiation shares the reconnect budget, so a server that keeps failing cannot loop us
    if (is_version_supported(proposed)
        && ++session_.negotiations <= config_.max_reconnect_attempts) {
      session_.version = proposed;
      session_.session_id.reset();
      session_.state = ConnectionState::CONNECTING;
      url = session_.url;
      adopted = true;
    }
  }

  if (!adopted) {
    fail_version_(proposed);
    return;
  }

  INFO("server proposed protocol version '{}', connecting again", proposed);
  transport_->connect(url, *this);
}

void DdpClient::handle_(const protocol::PingMessage& msg) {
  send_(protocol::make_pong_frame(msg.id));
}

void DdpClient::handle_(const protocol::ServerErrorMessage& msg) {
  WARN("server error: {}", msg.reason);
  if (auto listener = listener_copy_()) {
    listener->on_exception(make_error_code(ecode::server_error),
                           msg.offending_message
                               ? format("{}, offending message: {}", msg.reason,
                                        *msg.offending_message)
                               : msg.reason);
  }
}

// --------------------------------------------------------------------------------- Data messages

void DdpClient::handle_(const protocol::AddedMessage& msg) {
  if (auto listener = listener_copy_())
    listener->on_data_added(msg.collection, msg.id, msg.fields.value_or(""));
}

void DdpClient::handle_(const protocol::ChangedMessage& msg) {
  if (auto listener = listener_copy_())
    listener->on_data_changed(msg.collection, msg.id, msg.fields.value_or(""),
                              msg.cleared.value_or(""));
}

void DdpClient::handle_(const protocol::RemovedMessage& msg) {
  if (auto listener = listener_copy_())
    listener->on_data_removed(msg.collection, msg.id);
}

// -------------------------------------------------------------------------------- Reply messages

void DdpClient::handle_(const protocol::ResultMessage& msg) {
  auto continuation = pending_.resolve_as<AwaitingResult>(msg.id);
  if (!continuation) {
    TRACE("no one waiting on result, id={}", msg.id);
    return;
  }

  auto& handler = std::get<AwaitingResult>(*continuation).handler;
  if (msg.error)
    handler(*msg.error, "");
  else
    handler(Status{}, msg.result.value_or(""));
}

void DdpClient::handle_(const protocol::ReadyMessage& msg) {
  for (const auto& id : msg.subs) {
    auto continuation = pending_.resolve_as<AwaitingReady>(id);
    if (!continuation) {
      TRACE("no one waiting on ready, id={}", id);
      continue;
    }
    std::get<AwaitingReady>(*continuation).handler(Status{});
  }
}

void DdpClient::handle_(const protocol::NoSubMessage& msg) {
  auto continuation = pending_.resolve_as<AwaitingReady, AwaitingUnsub>(msg.id);
  if (!continuation) {
    TRACE("no one waiting on nosub, id={}", msg.id);
    return;
  }

  if (auto* ready = std::get_if<AwaitingReady>(&*continuation)) {
    ready->handler(msg.error ? *msg.error : Status{StatusCode::CANCELLED});
  } else if (auto* unsub = std::get_if<AwaitingUnsub>(&*continuation)) {
    unsub->handler();
  }
}

// ---------------------------------------------------------------------------------------- Requests

void DdpClient::call(std::string_view method, const Json::Value& params, ResultHandler handler) {
  call_with_seed(method, std::nullopt, params, std::move(handler));
}

void DdpClient::call_with_seed(std::string_view method, const std::optional<string>& random_seed,
                               const Json::Value& params, ResultHandler handler) {
  Expects(!method.empty());
  auto id = unique_id();
  const auto frame = protocol::make_method_frame(method, id, params, random_seed);

  const bool has_handler = static_cast<bool>(handler);
  if (has_handler)
    pending_.insert(id, AwaitingResult{std::move(handler)});
  if (!send_(frame) && has_handler)
    pending_.resolve(id);
}

string DdpClient::subscribe(std::string_view name, const Json::Value& params,
                            SubscribeHandler handler) {
  Expects(!name.empty());
  auto id = unique_id();
  const auto frame = protocol::make_sub_frame(name, id, params);

  const bool has_handler = static_cast<bool>(handler);
  if (has_handler)
    pending_.insert(id, AwaitingReady{std::move(handler)});
  if (!send_(frame) && has_handler)
    pending_.resolve(id);
  return id;
}

void DdpClient::unsubscribe(std::string_view subscription_id, UnsubscribeHandler handler) {
  Expects(!subscription_id.empty());
  const auto frame = protocol::make_unsub_frame(subscription_id);

  const bool has_handler = static_cast<bool>(handler);
  if (has_handler)
    pending_.insert(string{subscription_id}, AwaitingUnsub{std::move(handler)});
  if (!send_(frame) && has_handler)
    pending_.resolve(subscription_id);
}

void DdpClient::insert(std::string_view collection, const Json::Value& document,
                       ResultHandler handler) {
  call(format("/{}/insert", collection), array_of({document}), std::move(handler));
}

void DdpClient::update(std::string_view collection, const Json::Value& selector,
                       const Json::Value& modifier, const Json::Value& options,
                       ResultHandler handler) {
  call(format("/{}/update", collection), array_of({selector, modifier, options}),
       std::move(handler));
}

void DdpClient::remove(std::string_view collection, std::string_view document_id,
                       ResultHandler handler) {
  Json::Value selector{Json::objectValue};
  selector[string{protocol::field::k_document_id}] = string{document_id};
  call(format("/{}/remove", collection), array_of({selector}), std::move(handler));
}

} // namespace ddp
