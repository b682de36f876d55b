#pragma once

#include <stop_token>
#include <vector>

#include "api/outbox/v1.hpp"

namespace outbox::messaging {

/*
  Immediate delivery channel.

  Send() receives the whole ordered batch of one flush in a single
  call so transports that batch or transact can do so. Throwing
  rejects the batch; the flusher keeps the rows.
*/
class MessageBus {
 public:
  virtual ~MessageBus() = default;

  virtual void Send(const std::vector<v1::Envelope>& envelopes, std::stop_token stop) = 0;
};

/*
  Scheduled delivery channel. One call per item; the channel honors
  scheduled_time.
*/
class ScheduledMessageBus {
 public:
  virtual ~ScheduledMessageBus() = default;

  virtual void Send(const v1::ScheduledEnvelope& envelope, std::stop_token stop) = 0;
};

} // namespace outbox::messaging
