#pragma once

#include <exception>
#include <string>

#include "internal/util/uuid.hpp"

namespace outbox::processes {

/*
  What ProcessManagerStore knows about a flush that failed after the
  transition was committed.
*/
struct CommandPublisherExceptionContext {
  std::string        process_manager_type;
  util::UUID         process_manager_id{};
  std::exception_ptr exception;

  // what() of the exception, or a placeholder for non-std exceptions
  std::string Message() const;
};

enum class HandlerDecision {
  kPropagate,
  kHandled,
};

class CommandPublisherExceptionHandler {
 public:
  virtual ~CommandPublisherExceptionHandler() = default;

  // kHandled: the save succeeds and delivery is left to a later sweep.
  virtual HandlerDecision Handle(const CommandPublisherExceptionContext& context) = 0;
};

// Never suppresses.
class DefaultCommandPublisherExceptionHandler final : public CommandPublisherExceptionHandler {
 public:
  HandlerDecision Handle(const CommandPublisherExceptionContext&) override {
    return HandlerDecision::kPropagate;
  }
};

// Logs a warning and suppresses every failure.
class LoggingCommandPublisherExceptionHandler final : public CommandPublisherExceptionHandler {
 public:
  HandlerDecision Handle(const CommandPublisherExceptionContext& context) override;
};

} // namespace outbox::processes
