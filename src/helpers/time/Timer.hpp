#pragma once

#include <chrono>

class CTimer {
  public:
    using steady_tp  = std::chrono::steady_clock::time_point;
    using steady_dur = std::chrono::steady_clock::duration;

    void             reset();
    float            getSeconds() const;
    float            getMillis() const;
    const steady_tp& chrono() const;

  private:
    steady_tp  m_lastReset = std::chrono::steady_clock::now();

    steady_dur getDuration() const;
};
