#pragma once

// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 Lloyal Labs

/**
 * @file periodic_task.hpp
 * @brief Cancellable repeating background task
 *
 * Runs `tick` every `interval_ms` on a worker thread, started by the
 * constructor. stop() may be called any number of times; the first call
 * wakes the worker, joins it, and later calls return immediately. An
 * interval of 0 never starts a worker (used by tests that drive sweeps by
 * hand).
 *
 * An exception escaping `tick` is logged and the loop keeps running.
 */

#include "common.hpp"

#include <chrono>
#include <condition_variable>
#include <exception>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <utility>

namespace trellis {

class PeriodicTask {
public:
  PeriodicTask() = default;

  PeriodicTask(std::string name, int64_t interval_ms, std::function<void()> tick)
      : name_(std::move(name)), interval_ms_(interval_ms), tick_(std::move(tick)) {
    if (interval_ms_ > 0 && tick_) {
      running_ = true;
      thread_ = std::thread([this]() { run_loop(); });
      TRELLIS_LOG_DEBUG("[periodic::%s] Started (interval=%lldms)",
                        name_.c_str(), static_cast<long long>(interval_ms_));
    }
  }

  ~PeriodicTask() { stop(); }

  PeriodicTask(const PeriodicTask&) = delete;
  PeriodicTask& operator=(const PeriodicTask&) = delete;

  void stop() {
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (!running_) return;
      running_ = false;
    }
    cv_.notify_all();
    if (thread_.joinable()) {
      thread_.join();
    }
    TRELLIS_LOG_DEBUG("[periodic::%s] Stopped", name_.c_str());
  }

  bool is_running() const {
    std::lock_guard<std::mutex> lock(mu_);
    return running_;
  }

private:
  void run_loop() {
    std::unique_lock<std::mutex> lock(mu_);
    while (running_) {
      bool stopped = cv_.wait_for(lock, std::chrono::milliseconds(interval_ms_),
                                  [this]() { return !running_; });
      if (stopped) break;

      lock.unlock();
      try {
        tick_();
      } catch (const std::exception& e) {
        TRELLIS_LOG_ERROR("[periodic::%s] Tick failed: %s", name_.c_str(), e.what());
      }
      lock.lock();
    }
  }

  std::string name_;
  int64_t interval_ms_ = 0;
  std::function<void()> tick_;

  mutable std::mutex mu_;
  std::condition_variable cv_;
  bool running_ = false;
  std::thread thread_;
};

}  // namespace trellis
