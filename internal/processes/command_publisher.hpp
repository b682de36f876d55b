#pragma once

#include <future>
#include <stop_token>

#include "internal/util/uuid.hpp"

namespace outbox::processes {

/*
  Drains pending commands to the delivery channels.
*/
class CommandPublisher {
 public:
  virtual ~CommandPublisher() = default;

  // Delivers every pending row of one instance that exists when the
  // call starts. Throws util::InvalidArgument for the empty id.
  virtual void FlushCommands(const util::UUID& process_manager_id, std::stop_token stop) = 0;

  // Flushes every instance with pending rows until a pass finds none.
  // The future carries completion and the first error.
  virtual std::future<void> EnqueueAll(std::stop_token stop) = 0;
};

} // namespace outbox::processes
