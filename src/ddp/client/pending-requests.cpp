#include "pending-requests.hpp"

namespace ddp {

void PendingRequests::insert(std::string id, Continuation continuation) {
  std::lock_guard lock{padlock_};
  continuations_.insert_or_assign(std::move(id), std::move(continuation));
}

std::optional<Continuation> PendingRequests::resolve(std::string_view id) {
  std::lock_guard lock{padlock_};
  auto ii = continuations_.find(std::string{id});
  if (ii == continuations_.end())
    return std::nullopt;
  auto continuation = std::move(ii->second);
  continuations_.erase(ii);
  return continuation;
}

std::size_t PendingRequests::clear() {
  std::unordered_map<std::string, Continuation> dropped;
  { // Handlers may own resources, so destroy them outside the lock
    std::lock_guard lock{padlock_};
    dropped.swap(continuations_);
  }
  return dropped.size();
}

std::size_t PendingRequests::size() const {
  std::lock_guard lock{padlock_};
  return continuations_.size();
}

bool PendingRequests::contains(std::string_view id) const {
  std::lock_guard lock{padlock_};
  return continuations_.find(std::string{id}) != continuations_.end();
}

} // namespace ddp
