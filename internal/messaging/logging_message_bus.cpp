#include "logging_message_bus.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace outbox::messaging {

using observability::IntField;
using observability::StringField;

void LoggingMessageBus::Send(const std::vector<v1::Envelope>& envelopes, std::stop_token stop) {
  if (stop.stop_requested()) {
    throw util::Cancelled("send cancelled");
  }

  for (const auto& envelope : envelopes) {
    OUTBOX_LOG_INFO("command", {StringField("message_id", envelope.message_id()),
                                StringField("correlation_id", envelope.has_correlation_id() ? envelope.correlation_id() : "-"),
                                StringField("type", envelope.message().type_url())});
  }
}

void LoggingMessageBus::Send(const v1::ScheduledEnvelope& scheduled, std::stop_token stop) {
  if (stop.stop_requested()) {
    throw util::Cancelled("send cancelled");
  }

  const auto& envelope = scheduled.envelope();
  OUTBOX_LOG_INFO("scheduled command",
                  {StringField("message_id", envelope.message_id()),
                   StringField("correlation_id", envelope.has_correlation_id() ? envelope.correlation_id() : "-"),
                   StringField("type", envelope.message().type_url()),
                   IntField("scheduled_time_ms", static_cast<std::int64_t>(util::ToUnixMillis(util::FromProto(scheduled.scheduled_time()))))});
}

} // namespace outbox::messaging
