#pragma once
/** @file  Logger.hpp
 *  @brief Asynchronous CSV run logger (runs its own worker thread).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "core/SimulationClock.hpp"

namespace labcell {
  namespace io {
    class FileLogger;
  } // namespace io

  namespace core {

    struct LogEvent {
      TimePoint timestamp{};
      std::string category; ///< MOVE, PICK, TRANSFER, ERROR, ...
      std::string message;
    };

    class ErrorMonitor;

    /**
 * @class Logger
 * @brief Producers enqueue LogEvents without blocking on I/O; a worker thread
 *        drains the queue into a FileLogger as `timestamp,category,message`.
 *
 *  * One run per startNewRun()/finishRun() pair.
 *  * Events logged while no run is active are dropped.
 *  * Write failures are only recorded by the worker; finishRun() reports them
 *    to the ErrorMonitor on the calling thread.
 */
    class Logger {

    public:
      explicit Logger(std::shared_ptr<ErrorMonitor> errMonitor = nullptr);
      ~Logger(); ///< finishRun() if still active

      Logger(const Logger&) = delete;
      Logger& operator=(const Logger&) = delete;

      // --- public API ---
      bool startNewRun(const std::string& csvPath); ///< open file + launch worker thread; false if unopenable
      void log(LogEvent event);                     ///< enqueue event (non-blocking)
      bool finishRun();                             ///< join worker + close; false if any line was lost

      bool running() const { return running_.load(); }
      std::size_t written() const { return written_.load(); } ///< lines flushed to disk this run

    private:
      void workerLoop();

      std::shared_ptr<ErrorMonitor> errorMonitor_;
      std::unique_ptr<io::FileLogger> csvFile_;
      std::deque<LogEvent> queue_;
      std::mutex mtx_;
      std::condition_variable cv_;
      std::thread worker_;
      std::atomic<bool> running_{ false };
      std::atomic<std::size_t> written_{ 0 };
      std::atomic<bool> writeFailed_{ false };
    };

  } // namespace core
} // namespace labcell
