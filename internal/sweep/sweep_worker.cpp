#include "sweep_worker.hpp"

#include <exception>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/processes/command_publisher.hpp"
#include "internal/util/errors.hpp"

namespace outbox::sweep {

SweepWorker::SweepWorker(std::shared_ptr<processes::CommandPublisher> publisher,
                         std::chrono::milliseconds interval,
                         bool run_on_start)
    : publisher_(std::move(publisher)), interval_(interval), run_on_start_(run_on_start) {
  if (!publisher_) {
    throw util::InvalidArgument("SweepWorker requires a publisher");
  }
  if (interval_.count() <= 0) {
    throw util::InvalidArgument("sweep interval must be positive");
  }
}

SweepWorker::~SweepWorker() {
  Stop();
}

void SweepWorker::Start() {
  if (thread_.joinable()) {
    return;
  }
  stop_source_ = std::stop_source();
  thread_      = std::thread(&SweepWorker::Run, this, stop_source_.get_token());
}

void SweepWorker::Stop() {
  stop_source_.request_stop();
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

void SweepWorker::Trigger() {
  {
    std::lock_guard lock(mutex_);
    triggered_ = true;
  }
  cv_.notify_all();
}

uint64_t SweepWorker::CompletedPasses() const {
  std::lock_guard lock(mutex_);
  return completed_passes_;
}

uint64_t SweepWorker::FailedPasses() const {
  std::lock_guard lock(mutex_);
  return failed_passes_;
}

void SweepWorker::Run(std::stop_token stop) {
  if (run_on_start_) {
    RunPass(stop);
  }

  while (!stop.stop_requested()) {
    {
      std::unique_lock lock(mutex_);
      cv_.wait_for(lock, stop, interval_, [&] { return triggered_; });
      triggered_ = false;
    }
    if (stop.stop_requested()) break;

    RunPass(stop);
  }
}

void SweepWorker::RunPass(std::stop_token stop) {
  bool ok = false;
  try {
    publisher_->EnqueueAll(stop).get();
    ok = true;
  } catch (const util::Cancelled&) {
    OUTBOX_LOG_DEBUG("sweep pass cancelled");
  } catch (const std::exception& e) {
    OUTBOX_LOG_ERROR("sweep pass failed", {observability::StringField("error", e.what())});
  }

  std::lock_guard lock(mutex_);
  if (ok) {
    ++completed_passes_;
  } else {
    ++failed_passes_;
  }
}

} // namespace outbox::sweep
