/* @file Logger.cpp
 * @brief ring buffer + writer thread that drains LogEvents into a CSV file
 *
 * © 2025 ferry contributors — MIT-licensed.
 */

// STL headers
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

// ferry headers
#include "core/Logger.hpp"

using namespace ferry::core;

namespace {

  std::string timestamp(std::chrono::system_clock::time_point t) {
    using namespace std::chrono;
    const auto secs = system_clock::to_time_t(t);
    const auto ms = duration_cast<milliseconds>(t.time_since_epoch()).count() % 1000;
    std::tm utc{};
    gmtime_r(&secs, &utc);
    std::ostringstream os;
    os << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
       << ms << 'Z';
    return os.str();
  }

} // namespace

const char* ferry::core::toString(LogLevel level) {
  switch (level) {
  case LogLevel::Debug:
    return "DEBUG";
  case LogLevel::Info:
    return "INFO";
  case LogLevel::Warning:
    return "WARN";
  case LogLevel::Error:
    return "ERROR";
  default:
    return "UNKNOWN";
  }
}

std::string ferry::core::formatCsv(const LogEvent& event) {
  std::string row = timestamp(event.time);
  row += ',';
  row += toString(event.level);
  row += ',';
  row += event.source;
  row += ",\"";
  for (char c : event.message) {
    if (c == '"')
      row += "\"\""; // CSV quote escaping
    else if (c == '\n')
      row += ' ';
    else
      row += c;
  }
  row += "\"\n";
  return row;
}

Logger::Logger(std::size_t capacity) : buffer_(std::make_unique<RingBuffer<LogEvent>>(capacity)) {}

Logger::~Logger() { finishRun(); }

void Logger::startNewRun(const std::string& csvPath, LogLevel threshold) {
  finishRun();
  if (!csvFile_.open(csvPath))
    throw std::runtime_error("[Logger] cannot open log file: " + csvPath);
  threshold_ = threshold;
  dropped_ = 0;
  running_ = true;
  worker_ = std::thread(&Logger::writerLoop, this);
}

void Logger::log(const LogEvent& event) {
  if (event.level < threshold_.load())
    return;

  if (!running_) {
    if (event.level >= LogLevel::Warning)
      std::cerr << formatCsv(event);
    return;
  }

  if (!buffer_->push(event)) {
    ++dropped_;
    return;
  }
  wake_.notify_one();
}

void Logger::log(LogLevel level, const std::string& source, const std::string& message) {
  log(LogEvent{ std::chrono::system_clock::now(), level, source, message });
}

void Logger::finishRun() {
  if (!running_.exchange(false)) {
    return;
  }
  wake_.notify_one();
  if (worker_.joinable())
    worker_.join();
  drain();
  csvFile_.close();
}

//---worker---------------------------------------------------------------------
void Logger::writerLoop() {
  while (running_) {
    {
      std::unique_lock lock(wakeMtx_);
      wake_.wait_for(lock, std::chrono::milliseconds(50),
                     [this] { return !running_ || buffer_->size() > 0; });
    }
    drain();
  }
}

void Logger::drain() {
  bool wrote = false;
  while (auto event = buffer_->pop()) {
    csvFile_.write(formatCsv(*event));
    wrote = true;
  }
  if (wrote)
    csvFile_.flush();
}
