#pragma once
/** @file  FakeClock.hpp
 *  @brief Manually advanced Clock so lease expiry is deterministic.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include "core/Clock.hpp"

namespace petctl {
  namespace test {

    class FakeClock : public petctl::core::Clock {
    public:
      TimePoint now() const override { return now_; }

      void advance(std::chrono::milliseconds d) { now_ += d; }

    private:
      TimePoint now_{ std::chrono::seconds{ 1000 } };
    };

  } // namespace test
} // namespace petctl
