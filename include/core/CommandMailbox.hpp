#pragma once
/** @file  CommandMailbox.hpp
 *  @brief Bounded FIFO of Commands feeding the engine's worker thread.
 *
 *  © 2025 ferry contributors — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

// ferry headers
#include "core/Command.hpp"

namespace ferry {
  namespace core {

    /**
 * @class CommandMailbox
 * @brief Many producers, one consumer.
 *
 *  * `post()` blocks while the box is full and throws `NotRunningError` once closed.
 *  * `receiveUntil()` returns nullopt when the deadline passes or the box is
 *    closed and empty.
 *  * Commands are delivered in arrival order.
 */
    class CommandMailbox {
    public:
      using Clock = std::chrono::steady_clock;

      explicit CommandMailbox(std::size_t capacity);

      //---public APIs------------------------------------------------------
      void open();
      void close(); ///< wakes blocked producers; they throw NotRunningError
      bool isOpen() const;

      void post(Command cmd);
      std::optional<Command> receiveUntil(Clock::time_point deadline);

      /// Removes and returns everything still queued.
      std::vector<Command> drain();

      std::size_t size() const;
      std::size_t capacity() const { return capacity_; }

    private:
      const std::size_t capacity_;
      std::deque<Command> queue_;
      bool open_{ false };
      mutable std::mutex mtx_;
      std::condition_variable notEmpty_;
      std::condition_variable notFull_;
    };

  } // namespace core
} // namespace ferry
