#pragma once

#include <algorithm>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace qkdsync::core {

// Topic-filtered progress channel between simulation workers and front ends.
// Subscriptions are kept in registration order and identified by the token
// returned from subscribe(). publish() snapshots the matching handlers and
// calls them on the publishing thread with the lock released, so a handler
// may subscribe or unsubscribe. Exceptions thrown by a handler propagate to
// the publisher.
template <typename Payload>
class EventBus {
public:
  using Callback = std::function<void(const Payload &)>;

  int subscribe(std::string topic, Callback cb) {
    std::scoped_lock lk(mutex_);
    const int token = ++lastToken_;
    entries_.push_back(
        {token, std::move(topic),
         std::make_shared<const Callback>(std::move(cb))});
    return token;
  }

  /// Unknown or already removed tokens are ignored.
  void unsubscribe(int token) {
    std::scoped_lock lk(mutex_);
    std::erase_if(entries_,
                  [token](const Entry &e) { return e.token == token; });
  }

  std::size_t subscriberCount(const std::string &topic) const {
    std::scoped_lock lk(mutex_);
    return static_cast<std::size_t>(
        std::count_if(entries_.begin(), entries_.end(),
                      [&topic](const Entry &e) { return e.topic == topic; }));
  }

  void publish(const std::string &topic, const Payload &payload) const {
    std::vector<std::shared_ptr<const Callback>> handlers;
    {
      std::scoped_lock lk(mutex_);
      for (const auto &e : entries_) {
        if (e.topic == topic)
          handlers.push_back(e.handler);
      }
    }
    for (const auto &h : handlers)
      (*h)(payload);
  }

private:
  struct Entry {
    int token;
    std::string topic;
    std::shared_ptr<const Callback> handler;
  };

  mutable std::mutex mutex_;
  std::vector<Entry> entries_;
  int lastToken_{0};
};

} // namespace qkdsync::core
