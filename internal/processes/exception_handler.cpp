#include "exception_handler.hpp"

#include "internal/observability/logging.hpp"

namespace outbox::processes {

std::string CommandPublisherExceptionContext::Message() const {
  if (!exception) {
    return "no exception";
  }
  try {
    std::rethrow_exception(exception);
  } catch (const std::exception& e) {
    return e.what();
  } catch (...) {
    return "non-standard exception";
  }
}

HandlerDecision LoggingCommandPublisherExceptionHandler::Handle(const CommandPublisherExceptionContext& context) {
  OUTBOX_LOG_WARN("command flush failed; leaving commands for the sweep",
                  {observability::StringField("process_manager_type", context.process_manager_type),
                   observability::StringField("process_manager_id", util::ToString(context.process_manager_id)),
                   observability::StringField("error", context.Message())});
  return HandlerDecision::kHandled;
}

} // namespace outbox::processes
