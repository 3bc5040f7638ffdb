#pragma once
/** @file  Logger.hpp
 *  @brief Asynchronous CSV logger (runs its own worker thread).
 *
 *  © 2025 ferry contributors — MIT-licensed.
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "core/RingBuffer.hpp"
#include "io/FileLogger.hpp"

namespace ferry {
  namespace core {

    enum class LogLevel : std::uint8_t { Debug, Info, Warning, Error, Count };
    static_assert(static_cast<std::uint8_t>(LogLevel::Count) == 4,
                  "LogLevel count changed please update toString()");

    const char* toString(LogLevel level);

    struct LogEvent {
      std::chrono::system_clock::time_point time{ std::chrono::system_clock::now() };
      LogLevel level{ LogLevel::Info };
      std::string source; ///< component, e.g. "TransferEngine"
      std::string message;
    };

    /// One CSV row: `timestamp,level,source,"message"` (with trailing newline).
    std::string formatCsv(const LogEvent& event);

    class Logger {

    public:
      explicit Logger(std::size_t capacity = kDefaultCapacity);
      ~Logger();

      Logger(const Logger&) = delete;
      Logger& operator=(const Logger&) = delete;

      // --- public API ---
      /// open file + launch worker thread; throws std::runtime_error if unwritable
      void startNewRun(const std::string& csvPath, LogLevel threshold = LogLevel::Info);
      void log(const LogEvent& event); ///< enqueue event (non-blocking)
      void log(LogLevel level, const std::string& source, const std::string& message);
      void finishRun(); ///< flush + join worker thread

      bool active() const { return running_; }
      std::size_t dropped() const { return dropped_; } ///< events lost to a full buffer

    private:
      static constexpr std::size_t kDefaultCapacity = 1024;

      void writerLoop();
      void drain();

      io::FileLogger csvFile_;
      std::unique_ptr<RingBuffer<LogEvent>> buffer_;
      std::thread worker_;
      std::mutex wakeMtx_;
      std::condition_variable wake_;
      std::atomic<bool> running_{ false };
      std::atomic<LogLevel> threshold_{ LogLevel::Info };
      std::atomic<std::size_t> dropped_{ 0 };
    };

  } // namespace core
} // namespace ferry
