#pragma once

#include <cstddef>
#include <deque>
#include <mutex>
#include <string>

namespace ddp {

/**
 * @ingroup client
 * @brief Serialized frames waiting for the session to connect. FIFO, unbounded, threadsafe.
 */
class OutboundQueue {
private:
  mutable std::mutex padlock_;
  std::deque<std::string> frames_;

public:
  void push(std::string frame);

  /**
   * @brief Take every queued frame, in the order they were pushed.
   * Frames pushed after this returns are left for the next drain.
   */
  std::deque<std::string> drain();

  std::size_t clear();
  std::size_t size() const;
  bool empty() const { return size() == 0; }
};

} // namespace ddp
