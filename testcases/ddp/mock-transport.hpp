#pragma once

#include "ddp/net/transport.hpp"
#include "ddp/protocol/frames.hpp"
#include "ddp/utils/error-codes.hpp"

#include <json/json.h>

#include <string>
#include <string_view>
#include <vector>

namespace ddp::test {

/**
 * A scripted transport. Records what the client asks of it, and lets the test
 * deliver transport events by hand, on the test's thread.
 */
class MockTransport final : public net::Transport {
private:
  net::TransportListener* listener_{nullptr};
  bool open_{false};

public:
  std::vector<std::string> connects; //!< Urls passed to `connect`, in order
  int disconnects{0};
  std::vector<std::string> sent; //!< Frames passed to `send_text`, in order

  // ------------------------------------------------------------------------------- Transport

  void connect(std::string_view url, net::TransportListener& listener) override {
    connects.emplace_back(url);
    listener_ = &listener;
    open_ = false;
  }

  void disconnect() override {
    ++disconnects;
    listener_ = nullptr;
    open_ = false;
  }

  bool send_text(std::string_view text) override {
    if (!open_)
      return false;
    sent.emplace_back(text);
    return true;
  }

  bool is_open() const override { return open_; }

  // ------------------------------------------------------------------------------- Scripting

  bool has_listener() const { return listener_ != nullptr; }

  void emit_open() {
    open_ = true;
    if (listener_)
      listener_->on_transport_open();
  }

  /// The connection drops, or a connect attempt fails
  void emit_close(uint16_t code = 1006, std::string_view reason = "gone") {
    open_ = false;
    auto* listener = listener_;
    listener_ = nullptr;
    if (listener) {
      listener->on_transport_error(net::TransportOperation::READ,
                                   make_error_code(ecode::transport_error));
      listener->on_transport_close(code, reason);
    }
  }

  void emit_message(std::string_view text) {
    if (listener_)
      listener_->on_transport_message(text);
  }

  /// Open, then accept the handshake
  void emit_connected(std::string_view session = "session-1") {
    emit_open();
    emit_message(R"({"msg":"connected","session":")" + std::string{session} + R"("})");
  }

  /// The `i`th sent frame, parsed
  Json::Value sent_frame(std::size_t i) const {
    auto parsed = protocol::parse_json(sent.at(i));
    return parsed ? *parsed : Json::Value{};
  }

  Json::Value last_frame() const {
    return sent.empty() ? Json::Value{} : sent_frame(sent.size() - 1);
  }
};

} // namespace ddp::test
