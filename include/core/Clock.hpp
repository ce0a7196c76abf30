#pragma once
/** @file  Clock.hpp
 *  @brief Monotonic time source, swappable for tests.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>

namespace petctl {
  namespace core {

    class Clock {
    public:
      using TimePoint = std::chrono::steady_clock::time_point;

      virtual ~Clock() = default;
      virtual TimePoint now() const = 0;
    };

    class SteadyClock : public Clock {
    public:
      TimePoint now() const override { return std::chrono::steady_clock::now(); }
    };

  } // namespace core
} // namespace petctl
