#pragma once

#include "ddp/protocol/status.hpp"

#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>

namespace ddp {

/**
 * @ingroup client
 * @brief Completes a method call.
 *
 * On success `status.ok()` and `result` is the raw json `result` (empty if the
 * server sent none). On failure `status.code() == StatusCode::METHOD_ERROR`.
 */
using ResultHandler = std::function<void(const Status& status, std::string_view result)>;

/**
 * @ingroup client
 * @brief Completes a subscription: `OK` on `ready`, otherwise `SUBSCRIPTION_ERROR` or
 *        `CANCELLED` on `nosub`.
 */
using SubscribeHandler = std::function<void(const Status& status)>;

/**
 * @ingroup client
 * @brief Completes an unsubscription.
 */
using UnsubscribeHandler = std::function<void()>;

struct AwaitingResult {
  ResultHandler handler;
};

struct AwaitingReady {
  SubscribeHandler handler;
};

struct AwaitingUnsub {
  UnsubscribeHandler handler;
};

using Continuation = std::variant<AwaitingResult, AwaitingReady, AwaitingUnsub>;

// -------------------------------------------------------------------------------- PendingRequests

/**
 * @ingroup client
 * @brief Continuations waiting for a reply from the server, by request id.
 *
 * Threadsafe. A continuation is removed before it is handed out, so it
 * runs at most once.
 */
class PendingRequests {
private:
  mutable std::mutex padlock_;
  std::unordered_map<std::string, Continuation> continuations_;

public:
  /**
   * @brief Register `continuation` for `id`, replacing any continuation already there.
   */
  void insert(std::string id, Continuation continuation);

  /**
   * @brief Remove and return the continuation for `id`, whatever its kind.
   */
  std::optional<Continuation> resolve(std::string_view id);

  /**
   * @brief Remove and return the continuation for `id`, but only if it is one of `Kinds`.
   * A continuation of any other kind stays registered.
   */
  template <typename... Kinds> std::optional<Continuation> resolve_as(std::string_view id) {
    std::lock_guard lock{padlock_};
    auto ii = continuations_.find(std::string{id});
    if (ii == continuations_.end())
      return std::nullopt;
    if (!(std::holds_alternative<Kinds>(ii->second) || ...))
      return std::nullopt;
    auto continuation = std::move(ii->second);
    continuations_.erase(ii);
    return continuation;
  }

  /**
   * @brief Drop every continuation, without invoking any.
   * @return The number dropped.
   */
  std::size_t clear();

  std::size_t size() const;
  bool contains(std::string_view id) const;
};

} // namespace ddp
