#pragma once
/** @file  SimulationClock.hpp
 *  @brief Decides whether simulated durations are waited on or only accounted.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>

namespace labcell {
  namespace core {

    using Seconds = std::chrono::duration<double>;
    using TimePoint = std::chrono::system_clock::time_point;

    /**
 * @class SimulationClock
 * @brief Strategy interface: RobotArm computes durations, the runner hands
 *        them here, the clock implementation picks the waiting policy.
 */
    class SimulationClock {
    public:
      virtual ~SimulationClock() = default;

      /// Wall-clock time used to stamp records.
      virtual TimePoint now() const = 0;

      /// Let \p d of simulated time pass.
      virtual void advance(Seconds d) = 0;
    };

    /**
 * @class VirtualClock
 * @brief Never blocks. Time starts at \p start and moves only on advance().
 */
    class VirtualClock : public SimulationClock {
    public:
      explicit VirtualClock(TimePoint start = std::chrono::system_clock::now()) : now_(start) {}

      TimePoint now() const override { return now_; }
      void advance(Seconds d) override;

      /// Sum of every advance() so far.
      Seconds elapsed() const { return elapsed_; }

    private:
      TimePoint now_;
      Seconds elapsed_{ 0.0 };
    };

    /// Longest single real-time sleep unless configured otherwise.
    inline constexpr double kDefaultMaxWaitSeconds = 1.0;

    /**
 * @class RealTimeClock
 * @brief Sleeps `d * timeScale`, capped at \p maxWait per call.
 */
    class RealTimeClock : public SimulationClock {
    public:
      explicit RealTimeClock(double timeScale = 1.0,
                             Seconds maxWait = Seconds{ kDefaultMaxWaitSeconds });

      TimePoint now() const override { return std::chrono::system_clock::now(); }
      void advance(Seconds d) override;

      double timeScale() const { return timeScale_; }
      Seconds maxWait() const { return maxWait_; }

    private:
      double timeScale_;
      Seconds maxWait_;
    };

  } // namespace core
} // namespace labcell
