#pragma once

#include <cassert>
#include <chrono>

class Timer {
  using Clock = std::chrono::steady_clock;

  Clock::time_point startTime;
  Clock::time_point stopTime;
  bool running;

public:
  Timer() : running(false) {}

  void Start(void) {
    startTime = Clock::now();
    running = true;
  }

  void Stop(void) {
    assert(running);
    stopTime = Clock::now();
    running = false;
  }

  // Seconds between Start and Stop, or between Start and now if still running.
  double GetNumElapsedSeconds(void) const {
    Clock::time_point end = running ? Clock::now() : stopTime;
    return std::chrono::duration<double>(end - startTime).count();
  }
};
