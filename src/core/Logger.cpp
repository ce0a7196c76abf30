/* @file Logger.cpp
 * @brief run log: producers enqueue, one worker writes CSV
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <iostream>

// PetCtl headers
#include "core/Logger.hpp"
#include "core/RingBuffer.hpp"

using namespace petctl::core;

namespace {

  std::string csvField(const std::string& raw) {
    if (raw.find_first_of(",\"\n") == std::string::npos)
      return raw;
    std::string out = "\"";
    for (char c : raw) {
      if (c == '"')
        out += '"';
      out += c;
    }
    out += '"';
    return out;
  }

  constexpr auto kPollInterval = std::chrono::milliseconds{ 50 };

} // namespace

std::string petctl::core::toCsv(const LogEvent& event) {
  return std::to_string(event.timestampMs) + ',' + toString(event.level) + ',' +
         csvField(event.source) + ',' + csvField(event.message) + '\n';
}

Logger::Logger(std::size_t capacity)
    : buffer_(std::make_unique<RingBuffer<LogEvent>>(capacity)) {}

Logger::~Logger() { finishRun(); }

bool Logger::startNewRun(const std::string& path) {
  if (running_)
    finishRun();

  if (!csvFile_.open(path)) {
    std::cerr << "[Logger] cannot open run log " << path << "\n";
    return false;
  }
  csvFile_.write("timestamp_ms,level,source,message\n");
  std::lock_guard<std::mutex> lock(runMtx_);
  dropped_ = 0;
  running_ = true;
  worker_ = std::thread(&Logger::workerLoop, this);
  return true;
}

bool Logger::log(const LogEvent& event) {
  // check + push under runMtx_ so finishRun() can't slip in between
  std::lock_guard<std::mutex> lock(runMtx_);
  if (!running_)
    return false;
  if (!buffer_->tryPush(event)) {
    ++dropped_;
    return false;
  }
  return true;
}

void Logger::finishRun() {
  {
    std::lock_guard<std::mutex> lock(runMtx_);
    if (!running_.exchange(false))
      return;
  }
  buffer_->wakeAll();
  if (worker_.joinable())
    worker_.join();
  drain(); // everything accepted before the flag flip belongs to this run
  if (dropped_ > 0)
    csvFile_.write(toCsv(LogEvent::make(LogLevel::Warn, "Logger",
                                        std::to_string(dropped_.load()) + " events dropped")));
  if (!csvFile_.flush())
    std::cerr << "[Logger] flush failed on finishRun\n";
  csvFile_.close();
}

void Logger::workerLoop() {
  while (running_) {
    if (auto ev = buffer_->popFor(kPollInterval))
      csvFile_.write(toCsv(*ev));
  }
}

void Logger::drain() {
  while (auto ev = buffer_->tryPop())
    csvFile_.write(toCsv(*ev));
}
