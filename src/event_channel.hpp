#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <utility>

// Unbuffered hand-off between threads: send() returns only after a receiver
// has taken the item, so at most one item is ever in flight. close() wakes
// every blocked sender and receiver.
template<typename T>
class EventChannel {
public:
  EventChannel() = default;
  EventChannel(const EventChannel&) = delete;
  EventChannel& operator=(const EventChannel&) = delete;

  // Returns false if the channel was closed before the item was received.
  bool send(T item) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [&]{ return closed_ || !slot_; });
    if(closed_) return false;
    slot_ = std::move(item);
    const auto ticket = ++sent_;
    cv_.notify_all();
    cv_.wait(lock, [&]{ return closed_ || received_ >= ticket; });
    return received_ >= ticket;
  }

  std::optional<T> receive() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [&]{ return closed_ || slot_.has_value(); });
    return take_locked();
  }

  template<typename Rep, typename Period>
  std::optional<T> receive_for(std::chrono::duration<Rep, Period> timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [&]{ return closed_ || slot_.has_value(); });
    return take_locked();
  }

  void close() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      closed_ = true;
    }
    cv_.notify_all();
  }

  bool closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
  }

private:
  std::optional<T> take_locked() {
    if(!slot_ || closed_) return std::nullopt;
    std::optional<T> out = std::move(slot_);
    slot_.reset();
    ++received_;
    cv_.notify_all();
    return out;
  }

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::optional<T> slot_;
  std::uint64_t sent_ = 0;
  std::uint64_t received_ = 0;
  bool closed_ = false;
};
