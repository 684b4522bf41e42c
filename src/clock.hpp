#pragma once

#include <chrono>

#include "common.hpp"

class Clock {
  public:
    virtual ~Clock() = default;
    virtual Instant Now() const = 0;
};

class SystemClock : public Clock {
  public:
    Instant Now() const override {
        return std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now());
    }
};

// Deterministic clock for tests and replaying a fixed reference time.
class FixedClock : public Clock {
  public:
    explicit FixedClock(Instant now) : m_Now(now) {}
    Instant Now() const override { return m_Now; }
    void Set(Instant now) { m_Now = now; }
    void Advance(std::chrono::seconds by) { m_Now += by; }

  private:
    Instant m_Now;
};
