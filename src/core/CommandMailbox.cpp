/* @file CommandMailbox.cpp
 * @brief bounded blocking queue between engine callers and its worker thread
 *
 * © 2025 ferry contributors — MIT-licensed.
 */

// STL headers
#include <stdexcept>
#include <type_traits>
#include <utility>

// ferry headers
#include "core/CommandMailbox.hpp"
#include "core/Errors.hpp"

using namespace ferry::core;

//---Command helpers------------------------------------------------------------
const char* ferry::core::commandName(const Command& cmd) {
  return std::visit(
      [](const auto& c) -> const char* {
        using T = std::decay_t<decltype(c)>;
        if constexpr (std::is_same_v<T, CreateCommand>)
          return "create";
        else if constexpr (std::is_same_v<T, StatusCommand>)
          return "status";
        else if constexpr (std::is_same_v<T, CancelCommand>)
          return "cancel";
        else if constexpr (std::is_same_v<T, PollCommand>)
          return "poll";
        else
          return "stop";
      },
      cmd);
}

void ferry::core::failCommand(Command& cmd, std::exception_ptr error) {
  std::visit([&](auto& c) { c.reply.set_exception(error); }, cmd);
}

//---CommandMailbox-------------------------------------------------------------
CommandMailbox::CommandMailbox(std::size_t capacity) : capacity_(capacity) {
  if (capacity_ == 0)
    throw std::invalid_argument("[CommandMailbox] capacity must be positive");
}

void CommandMailbox::open() {
  std::lock_guard lock(mtx_);
  open_ = true;
}

void CommandMailbox::close() {
  {
    std::lock_guard lock(mtx_);
    open_ = false;
  }
  notFull_.notify_all();
  notEmpty_.notify_all();
}

bool CommandMailbox::isOpen() const {
  std::lock_guard lock(mtx_);
  return open_;
}

void CommandMailbox::post(Command cmd) {
  std::unique_lock lock(mtx_);
  notFull_.wait(lock, [this] { return !open_ || queue_.size() < capacity_; });
  if (!open_)
    throw NotRunningError();
  queue_.push_back(std::move(cmd));
  lock.unlock();
  notEmpty_.notify_one();
}

std::optional<Command> CommandMailbox::receiveUntil(Clock::time_point deadline) {
  std::unique_lock lock(mtx_);
  if (!notEmpty_.wait_until(lock, deadline, [this] { return !queue_.empty() || !open_; }))
    return std::nullopt; // deadline passed
  if (queue_.empty())
    return std::nullopt; // closed

  Command cmd = std::move(queue_.front());
  queue_.pop_front();
  lock.unlock();
  notFull_.notify_one();
  return cmd;
}

std::vector<Command> CommandMailbox::drain() {
  std::vector<Command> out;
  {
    std::lock_guard lock(mtx_);
    while (!queue_.empty()) {
      out.push_back(std::move(queue_.front()));
      queue_.pop_front();
    }
  }
  notFull_.notify_all();
  return out;
}

std::size_t CommandMailbox::size() const {
  std::lock_guard lock(mtx_);
  return queue_.size();
}
