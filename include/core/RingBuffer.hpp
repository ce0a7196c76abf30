#pragma once
/** @file  RingBuffer.hpp
 *  @brief Bounded MPSC queue feeding the Logger worker.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <vector>

namespace petctl {
  namespace core {

    /**
 * @class RingBuffer
 * @brief Fixed-capacity FIFO. Storage is allocated once in the ctor.
 *
 *  * `tryPush()` never blocks; returns false when full (caller drops).
 *  * `popFor()` blocks the consumer up to \p timeout.
 */
    template <typename T> class RingBuffer {
    public:
      explicit RingBuffer(std::size_t capacity) : slots_(capacity) {
        if (capacity == 0)
          throw std::invalid_argument("[RingBuffer] capacity must be > 0");
      }

      bool tryPush(T value) {
        {
          std::lock_guard<std::mutex> lock(mtx_);
          if (size_ == slots_.size())
            return false;
          slots_[(head_ + size_) % slots_.size()] = std::move(value);
          ++size_;
        }
        cv_.notify_one();
        return true;
      }

      std::optional<T> tryPop() {
        std::lock_guard<std::mutex> lock(mtx_);
        return popLocked();
      }

      std::optional<T> popFor(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mtx_);
        cv_.wait_for(lock, timeout, [this] { return size_ > 0; });
        return popLocked();
      }

      /// Wake a consumer blocked in popFor() (used on shutdown).
      void wakeAll() { cv_.notify_all(); }

      std::size_t size() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return size_;
      }

      std::size_t capacity() const { return slots_.size(); }

    private:
      std::optional<T> popLocked() {
        if (size_ == 0)
          return std::nullopt;
        std::optional<T> out{ std::move(slots_[head_]) };
        head_ = (head_ + 1) % slots_.size();
        --size_;
        return out;
      }

      std::vector<T> slots_;
      std::size_t head_{ 0 };
      std::size_t size_{ 0 };
      mutable std::mutex mtx_;
      std::condition_variable cv_;
    };

  } // namespace core
} // namespace petctl
