/**
 * @file clock.hpp
 * @brief Injectable wall clock
 */

#pragma once

#include <chrono>
#include <cstdint>

namespace frontdoor {

class Clock {
 public:
  virtual ~Clock() = default;

  /// Current time as unix seconds
  virtual int64_t nowSeconds() const = 0;
};

class SystemClock : public Clock {
 public:
  int64_t nowSeconds() const override {
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
  }
};

}  // namespace frontdoor
