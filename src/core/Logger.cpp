/* @file Logger.cpp
 * @brief worker-thread CSV logger
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <utility>

// labcell headers
#include "core/ErrorMonitor.hpp"
#include "core/Logger.hpp"
#include "io/FileLogger.hpp"
#include "io/ReportFormatter.hpp"

using namespace labcell::core;

Logger::Logger(std::shared_ptr<ErrorMonitor> errMonitor)
    : errorMonitor_(std::move(errMonitor)), csvFile_(std::make_unique<io::FileLogger>()) {}

Logger::~Logger() { finishRun(); }

bool Logger::startNewRun(const std::string& csvPath) {
  finishRun();

  // a missing run log is not a cell fault; the caller decides what to do
  if (!csvFile_->open(csvPath))
    return false;

  {
    std::lock_guard<std::mutex> lock(mtx_);
    queue_.clear();
    running_ = true;
  }
  written_ = 0;
  writeFailed_ = !csvFile_->write(io::csvHeader());
  worker_ = std::thread(&Logger::workerLoop, this);
  return true;
}

void Logger::log(LogEvent event) {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (!running_)
      return;
    queue_.push_back(std::move(event));
  }
  cv_.notify_one();
}

bool Logger::finishRun() {
  {
    // flip under the lock so the worker cannot miss the wakeup
    std::lock_guard<std::mutex> lock(mtx_);
    if (!running_)
      return true;
    running_ = false;
  }
  cv_.notify_one();
  if (worker_.joinable())
    worker_.join();

  const bool closed = csvFile_->close();
  const bool workerFailed = writeFailed_.exchange(false);
  if (closed && !workerFailed)
    return true;

  // reported here, on the caller's thread, never from the worker
  if (errorMonitor_)
    errorMonitor_->notifyFailure("[Logger] write to run log failed");
  return false;
}

void Logger::workerLoop() {
  std::unique_lock<std::mutex> lock(mtx_);
  for (;;) {
    cv_.wait(lock, [this] { return !queue_.empty() || !running_; });

    std::deque<LogEvent> batch;
    batch.swap(queue_);
    lock.unlock();

    bool ok = true;
    for (const auto& ev : batch)
      ok = csvFile_->write(io::toCsvLine(ev)) && ok;
    // a line only counts once it is on disk
    if (!batch.empty())
      ok = csvFile_->flush() && ok;

    if (ok)
      written_ += batch.size();
    else
      writeFailed_ = true;

    lock.lock();
    if (!running_ && queue_.empty())
      break;
  }
}
