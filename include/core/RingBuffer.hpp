#pragma once
/** @file  RingBuffer.hpp
 *  @brief Bounded FIFO between the engine thread and the log writer.
 *
 *  © 2025 ferry contributors — MIT-licensed.
 */

#include <cstddef>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace ferry {
  namespace core {

    /**
 * @class RingBuffer
 * @brief Fixed-capacity circular queue; `push()` never blocks.
 *
 *  * A full buffer rejects the new element (caller decides what to drop).
 *  * Mutex-protected; fine for a handful of producers.
 */
    template <typename T> class RingBuffer {
    public:
      explicit RingBuffer(std::size_t capacity) : slots_(capacity ? capacity : 1) {}

      /// @returns false if the buffer is full.
      bool push(T value) {
        std::lock_guard lock(mtx_);
        if (size_ == slots_.size())
          return false;
        slots_[(head_ + size_) % slots_.size()] = std::move(value);
        ++size_;
        return true;
      }

      std::optional<T> pop() {
        std::lock_guard lock(mtx_);
        if (size_ == 0)
          return std::nullopt;
        T out = std::move(slots_[head_]);
        head_ = (head_ + 1) % slots_.size();
        --size_;
        return out;
      }

      std::size_t size() const {
        std::lock_guard lock(mtx_);
        return size_;
      }

      std::size_t capacity() const { return slots_.size(); }

    private:
      std::vector<T> slots_;
      std::size_t head_{ 0 };
      std::size_t size_{ 0 };
      mutable std::mutex mtx_;
    };

  } // namespace core
} // namespace ferry
