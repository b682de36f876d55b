#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <stop_token>
#include <thread>

namespace outbox::processes {
class CommandPublisher;
}

namespace outbox::sweep {

/*
  Background worker that runs the startup/periodic sweep.

  Each pass calls CommandPublisher::EnqueueAll() and waits for it.
  Failed passes are logged and retried on the next interval.
  Stop() cancels the running pass and joins.
*/
class SweepWorker {
 public:
  SweepWorker(std::shared_ptr<processes::CommandPublisher> publisher,
              std::chrono::milliseconds interval,
              bool run_on_start = true);
  ~SweepWorker();

  void Start();
  void Stop();

  // wake the worker for an immediate pass
  void Trigger();

  uint64_t CompletedPasses() const;
  uint64_t FailedPasses() const;

 private:
  void Run(std::stop_token stop);
  void RunPass(std::stop_token stop);

  std::shared_ptr<processes::CommandPublisher> publisher_;
  std::chrono::milliseconds                    interval_;
  bool                                         run_on_start_;

  mutable std::mutex          mutex_;
  std::condition_variable_any cv_;
  bool                        triggered_ = false;
  uint64_t                    completed_passes_ = 0;
  uint64_t                    failed_passes_    = 0;

  std::stop_source stop_source_;
  std::thread      thread_;
};

} // namespace outbox::sweep
