#pragma once

#include <chrono>
#include <cstddef>
#include <algorithm>
#include <deque>
#include <mutex>
#include <vector>

#include "protocol.hpp"

struct ReceivedMessage {
  ChatMessage message;
  std::chrono::system_clock::time_point received_at;
};

// Bounded log of received messages; the oldest entry goes first once
// `limit` is reached.
class MessageHistory {
public:
  explicit MessageHistory(std::size_t limit) : limit_(limit == 0 ? 1 : limit) {}

  void add(const ChatMessage& message) {
    std::lock_guard lg(m_);
    entries_.push_back(ReceivedMessage{message, std::chrono::system_clock::now()});
    while(entries_.size() > limit_) entries_.pop_front();
  }

  // The last `count` entries, oldest first.
  std::vector<ReceivedMessage> recent(std::size_t count) const {
    std::lock_guard lg(m_);
    std::size_t n = std::min(count, entries_.size());
    return std::vector<ReceivedMessage>(entries_.end() - static_cast<std::ptrdiff_t>(n), entries_.end());
  }

  std::size_t size() const {
    std::lock_guard lg(m_);
    return entries_.size();
  }

private:
  mutable std::mutex m_;
  std::size_t limit_;
  std::deque<ReceivedMessage> entries_;
};
