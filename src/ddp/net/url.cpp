#include "url.hpp"

#include "ddp/utils/error-codes.hpp"

#include <charconv>

namespace ddp::net {

expected<WebsocketUrl, std::error_code> parse_websocket_url(std::string_view url) {
  const auto invalid = [url]() {
    TRACE("invalid websocket url: '{}'", url);
    return make_unexpected(make_error_code(ecode::invalid_url));
  };

  WebsocketUrl out;
  constexpr std::string_view k_ws = "ws://";
  constexpr std::string_view k_wss = "wss://";

  auto rest = url;
  if (rest.starts_with(k_wss)) {
    out.is_secure = true;
    rest.remove_prefix(k_wss.size());
  } else if (rest.starts_with(k_ws)) {
    rest.remove_prefix(k_ws.size());
  } else {
    return invalid();
  }

  // Split authority and target
  const auto slash = rest.find('/');
  auto authority = rest.substr(0, slash);
  if (slash != std::string_view::npos)
    out.target = std::string{rest.substr(slash)};

  // Split host and port; ipv6 literals are bracketed
  std::string_view host = authority;
  std::string_view port{};
  if (authority.starts_with('[')) {
    const auto close = authority.find(']');
    if (close == std::string_view::npos)
      return invalid();
    host = authority.substr(1, close - 1);
    const auto tail = authority.substr(close + 1);
    if (!tail.empty()) {
      if (tail.front() != ':')
        return invalid();
      port = tail.substr(1);
    }
  } else if (const auto colon = authority.rfind(':'); colon != std::string_view::npos) {
    host = authority.substr(0, colon);
    port = authority.substr(colon + 1);
  }

  if (host.empty())
    return invalid();
  out.host = std::string{host};

  if (port.empty()) {
    out.port = out.is_secure ? 443 : 80;
  } else {
    const auto [ptr, ec] = std::from_chars(port.data(), port.data() + port.size(), out.port);
    if (ec != std::errc{} || ptr != port.data() + port.size() || out.port == 0)
      return invalid();
  }

  return out;
}

} // namespace ddp::net
