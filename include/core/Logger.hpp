#pragma once
/** @file  Logger.hpp
 *  @brief Asynchronous CSV logger (runs its own worker thread).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "core/LogEvent.hpp"
#include "io/FileLogger.hpp"

namespace petctl {
  namespace core {

    template <typename T> class RingBuffer; // forward decl to avoid heavy include

    class Logger {

    public:
      static constexpr std::size_t kDefaultCapacity = 1024;

      explicit Logger(std::size_t capacity = kDefaultCapacity);
      virtual ~Logger(); ///< finishRun() if still running

      // --- public API ---
      bool startNewRun(const std::string& path); ///< open file + launch worker thread
      virtual bool log(const LogEvent& event);   ///< enqueue event (non-blocking)
      void finishRun();                          ///< flush + join worker thread

      bool running() const { return running_.load(); }
      std::size_t dropped() const { return dropped_.load(); }

      Logger(const Logger&) = delete;
      Logger& operator=(const Logger&) = delete;

    private:
      void workerLoop();
      void drain();

      io::FileLogger csvFile_;
      std::unique_ptr<RingBuffer<LogEvent>> buffer_;
      std::thread worker_;
      std::mutex runMtx_; ///< orders log() against the run flag flips
      std::atomic<bool> running_{ false };
      std::atomic<std::size_t> dropped_{ 0 };
    };

  } // namespace core
} // namespace petctl
