#pragma once

#include "internal/messaging/message_bus.hpp"

namespace outbox::messaging {

/*
  Writes every envelope to the log instead of delivering it. Sends
  succeed, so the flusher deletes the rows afterwards.
*/
class LoggingMessageBus final : public MessageBus, public ScheduledMessageBus {
 public:
  void Send(const std::vector<v1::Envelope>& envelopes, std::stop_token stop) override;
  void Send(const v1::ScheduledEnvelope& envelope, std::stop_token stop) override;
};

} // namespace outbox::messaging
