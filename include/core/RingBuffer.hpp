#pragma once
/** @file  RingBuffer.hpp
 *  @brief Bounded, mutex-protected FIFO between a producer and the Logger worker.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <vector>

namespace flowcal::core {

  template <typename T> class RingBuffer {
  public:
    explicit RingBuffer(std::size_t capacity) : slots_(capacity) {}

    /// Non-blocking; false when full.
    bool push(T item) {
      {
        std::lock_guard lock(mtx_);
        if (count_ == slots_.size())
          return false;
        slots_[(head_ + count_) % slots_.size()] = std::move(item);
        ++count_;
      }
      cv_.notify_one();
      return true;
    }

    /// Waits up to \p timeout for an item.
    std::optional<T> pop(std::chrono::milliseconds timeout) {
      std::unique_lock lock(mtx_);
      if (!cv_.wait_for(lock, timeout, [this] { return count_ > 0; }))
        return std::nullopt;
      T item = std::move(slots_[head_]);
      head_ = (head_ + 1) % slots_.size();
      --count_;
      return item;
    }

    std::size_t size() const {
      std::lock_guard lock(mtx_);
      return count_;
    }

    std::size_t capacity() const { return slots_.size(); }

  private:
    std::vector<T> slots_;
    std::size_t head_{ 0 };
    std::size_t count_{ 0 };
    mutable std::mutex mtx_;
    std::condition_variable cv_;
  };

} // namespace flowcal::core
