#include "outbound-queue.hpp"

#include "ddp/utils/base-include.hpp"

namespace ddp {

void OutboundQueue::push(std::string frame) {
  Expects(!frame.empty());
  std::lock_guard lock{padlock_};
  frames_.push_back(std::move(frame));
}

std::deque<std::string> OutboundQueue::drain() {
  std::deque<std::string> snapshot;
  std::lock_guard lock{padlock_};
  snapshot.swap(frames_);
  return snapshot;
}

std::size_t OutboundQueue::clear() { return drain().size(); }

std::size_t OutboundQueue::size() const {
  std::lock_guard lock{padlock_};
  return frames_.size();
}

} // namespace ddp
