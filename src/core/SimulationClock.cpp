/* @file SimulationClock.cpp
 * @brief virtual and wall-clock pacing strategies
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <stdexcept>
#include <thread>

// labcell headers
#include "core/SimulationClock.hpp"

using namespace labcell::core;

void VirtualClock::advance(Seconds d) {
  if (d.count() < 0.0)
    throw std::invalid_argument("[VirtualClock] negative duration");
  now_ += std::chrono::duration_cast<std::chrono::system_clock::duration>(d);
  elapsed_ += d;
}

RealTimeClock::RealTimeClock(double timeScale, Seconds maxWait)
    : timeScale_(timeScale), maxWait_(maxWait) {
  if (timeScale_ < 0.0)
    throw std::invalid_argument("[RealTimeClock] time scale must be >= 0");
}

void RealTimeClock::advance(Seconds d) {
  if (d.count() < 0.0)
    throw std::invalid_argument("[RealTimeClock] negative duration");
  const Seconds wait = std::min(d * timeScale_, maxWait_);
  if (wait.count() > 0.0)
    std::this_thread::sleep_for(wait);
}
