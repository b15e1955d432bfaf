#pragma once

#include "ddp/utils/base-include.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace ddp::net {

/**
 * @brief The parts of a `ws://` or `wss://` url.
 */
struct WebsocketUrl {
  bool is_secure{false}; //!< wss://
  std::string host{};
  uint16_t port{0}; //!< Defaults to 80 (ws) or 443 (wss)
  std::string target{"/"};
};

/**
 * @brief Parse `url`, e.g., "wss://example.meteor.com/websocket"
 * Fails with `ecode::invalid_url`
 */
expected<WebsocketUrl, std::error_code> parse_websocket_url(std::string_view url);

} // namespace ddp::net
