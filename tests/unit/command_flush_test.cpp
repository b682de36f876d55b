#include <atomic>
#include <cassert>
#include <chrono>
#include <future>
#include <iostream>
#include <memory>
#include <set>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/messaging/json_message_serializer.hpp"
#include "internal/processes/repository_command_publisher.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "tests/support/outbox_fakes.hpp"

namespace {

using outbox::db::ErrorCode;
using outbox::db::Result;
using outbox::db::memory::MemoryRepository;
using outbox::messaging::JsonMessageSerializer;
using outbox::processes::RepositoryCommandPublisher;
using outbox::testing::CountPending;
using outbox::testing::CountPendingScheduled;
using outbox::testing::HookedRepository;
using outbox::testing::RecordingMessageBus;
using outbox::testing::SeedCommands;
using outbox::testing::SeedScheduledCommands;
using outbox::testing::UnpackText;
namespace util = outbox::util;

struct Fixture {
  std::shared_ptr<MemoryRepository>           memory = std::make_shared<MemoryRepository>();
  std::shared_ptr<HookedRepository>           repository = std::make_shared<HookedRepository>(memory);
  std::shared_ptr<RecordingMessageBus>        bus        = std::make_shared<RecordingMessageBus>();
  std::shared_ptr<RepositoryCommandPublisher> publisher  = std::make_shared<RepositoryCommandPublisher>(
      repository, std::make_shared<JsonMessageSerializer>(), bus, bus);
};

void TestFlushSendsOneOrderedBatchThenDeletes() {
  Fixture    f;
  const auto a = util::GenerateUUID();
  const auto b = util::GenerateUUID();
  SeedCommands(*f.memory, util::ToString(a), {"reserve", "charge", "ship"});
  SeedCommands(*f.memory, util::ToString(b), {"other"});

  f.publisher->FlushCommands(a, {});

  const auto batches = f.bus->Batches();
  assert(batches.size() == 1);
  assert(batches[0].size() == 3);
  assert(UnpackText(batches[0][0].message()) == "reserve");
  assert(UnpackText(batches[0][1].message()) == "charge");
  assert(UnpackText(batches[0][2].message()) == "ship");

  std::set<std::string> message_ids;
  for (const auto& envelope : batches[0]) message_ids.insert(envelope.message_id());
  assert(message_ids.size() == 3);

  assert(CountPending(*f.memory, util::ToString(a)) == 0);
  assert(CountPending(*f.memory, util::ToString(b)) == 1);
}

void TestFlushOfInstanceWithoutRowsSendsNothing() {
  Fixture f;
  f.publisher->FlushCommands(util::GenerateUUID(), {});
  assert(f.bus->Batches().empty());
  assert(f.bus->Scheduled().empty());
}

void TestEmptyIdIsRejectedBeforeAnyIo() {
  Fixture f;
  bool    threw = false;
  try {
    f.publisher->FlushCommands(util::UUID{}, {});
  } catch (const util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
  assert(f.repository->begins == 0);
  assert(f.repository->list_calls == 0);
  assert(f.repository->scheduled_list_calls == 0);
  assert(f.repository->delete_attempts == 0);
  assert(f.repository->probes == 0);
  assert(f.bus->Batches().empty());
  assert(f.bus->Scheduled().empty());
}

void TestSendFailureKeepsEveryRow() {
  Fixture    f;
  const auto id = util::GenerateUUID();
  SeedCommands(*f.memory, util::ToString(id), {"one", "two"});

  f.bus->on_send = [](const std::vector<outbox::v1::Envelope>&) { throw util::DeliveryFailure("broker down"); };

  bool threw = false;
  try {
    f.publisher->FlushCommands(id, {});
  } catch (const util::DeliveryFailure&) {
    threw = true;
  }
  assert(threw);
  assert(f.repository->delete_attempts == 0);
  assert(CountPending(*f.memory, util::ToString(id)) == 2);

  // retry after recovery delivers the same rows
  f.bus->on_send = nullptr;
  f.publisher->FlushCommands(id, {});
  assert(f.bus->Delivered().size() == 2);
  assert(CountPending(*f.memory, util::ToString(id)) == 0);
}

void TestRetryReusesStoredMessageIds() {
  Fixture    f;
  const auto id = util::GenerateUUID();
  SeedCommands(*f.memory, util::ToString(id), {"one"});

  std::vector<std::string> attempted;
  bool                     fail = true;
  f.bus->on_send                = [&](const std::vector<outbox::v1::Envelope>& envelopes) {
    attempted.push_back(envelopes[0].message_id());
    if (fail) throw util::DeliveryFailure("transient");
  };

  try {
    f.publisher->FlushCommands(id, {});
  } catch (const util::DeliveryFailure&) {
  }
  fail = false;
  f.publisher->FlushCommands(id, {});

  assert(attempted.size() == 2);
  assert(attempted[0] == attempted[1]);
}

void TestConcurrentlyDeletedRowCountsAsSuccess() {
  Fixture    f;
  const auto id   = util::GenerateUUID();
  const auto rows = SeedCommands(*f.memory, util::ToString(id), {"one", "two"});

  // another flusher removes the first row between load and delete
  f.repository->before_delete = [&](uint64_t row_id) -> std::optional<Result> {
    if (row_id != rows[0]) return std::nullopt;
    auto tx = f.memory->Begin();
    auto deleted = f.memory->DeletePendingCommand(*tx, row_id);
    assert(deleted);
    tx->Commit();
    return Result::Err(ErrorCode::NotFound, "gone");
  };

  f.publisher->FlushCommands(id, {});

  assert(f.repository->delete_attempts == 2);
  assert(CountPending(*f.memory, util::ToString(id)) == 0);
}

void TestConcurrentFlushesOfOneInstanceBothSucceed() {
  Fixture    f;
  const auto id = util::GenerateUUID();
  SeedCommands(*f.memory, util::ToString(id), {"one", "two", "three"});

  // hold both sends until both flushes loaded the same rows
  std::atomic<int> in_send{0};
  f.bus->on_send = [&](const std::vector<outbox::v1::Envelope>&) {
    ++in_send;
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (in_send < 2 && std::chrono::steady_clock::now() < deadline) {
      std::this_thread::yield();
    }
  };

  auto first  = std::async(std::launch::async, [&] { f.publisher->FlushCommands(id, {}); });
  auto second = std::async(std::launch::async, [&] { f.publisher->FlushCommands(id, {}); });
  first.get();
  second.get();

  assert(in_send == 2);
  assert(f.bus->Batches().size() == 2);
  assert(f.repository->delete_attempts == 6);
  assert(CountPending(*f.memory, util::ToString(id)) == 0);
}

void TestDeleteErrorOtherThanNotFoundFailsFlush() {
  Fixture    f;
  const auto id = util::GenerateUUID();
  SeedCommands(*f.memory, util::ToString(id), {"one", "two"});

  f.repository->before_delete = [](uint64_t) -> std::optional<Result> { return Result::Err(ErrorCode::IOError, "disk"); };

  bool threw = false;
  try {
    f.publisher->FlushCommands(id, {});
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
  assert(f.bus->Delivered().size() == 2);
  assert(CountPending(*f.memory, util::ToString(id)) == 2);
}

void TestCorrelationIdIsCarried() {
  Fixture    f;
  const auto with    = util::GenerateUUID();
  const auto without = util::GenerateUUID();
  SeedCommands(*f.memory, util::ToString(with), {"x"}, std::string("corr-7"));
  SeedCommands(*f.memory, util::ToString(without), {"y"});

  f.publisher->FlushCommands(with, {});
  f.publisher->FlushCommands(without, {});

  const auto delivered = f.bus->Delivered();
  assert(delivered.size() == 2);
  assert(delivered[0].has_correlation_id());
  assert(delivered[0].correlation_id() == "corr-7");
  assert(!delivered[1].has_correlation_id());
}

void TestScheduledCommandsAreSentOneByOneWithTheirTime() {
  Fixture    f;
  const auto id = util::GenerateUUID();
  SeedScheduledCommands(*f.memory, util::ToString(id), {{"remind", 1700000000123}, {"expire", 1700000999000}});

  f.publisher->FlushCommands(id, {});

  const auto scheduled = f.bus->Scheduled();
  assert(scheduled.size() == 2);
  assert(UnpackText(scheduled[0].envelope().message()) == "remind");
  assert(util::ToUnixMillis(util::FromProto(scheduled[0].scheduled_time())) == 1700000000123);
  assert(UnpackText(scheduled[1].envelope().message()) == "expire");
  assert(util::ToUnixMillis(util::FromProto(scheduled[1].scheduled_time())) == 1700000999000);
  assert(f.bus->Batches().empty());
  assert(CountPendingScheduled(*f.memory, util::ToString(id)) == 0);
}

void TestScheduledFailureKeepsUnattemptedRows() {
  Fixture    f;
  const auto id = util::GenerateUUID();
  SeedScheduledCommands(*f.memory, util::ToString(id), {{"a", 1}, {"b", 2}, {"c", 3}});

  f.bus->on_scheduled_send = [](const outbox::v1::ScheduledEnvelope& envelope) {
    if (UnpackText(envelope.envelope().message()) == "b") throw util::DeliveryFailure("rejected");
  };

  bool threw = false;
  try {
    f.publisher->FlushCommands(id, {});
  } catch (const util::DeliveryFailure&) {
    threw = true;
  }
  assert(threw);
  assert(f.bus->Scheduled().size() == 1);
  assert(CountPendingScheduled(*f.memory, util::ToString(id)) == 2);
}

void TestImmediateFailureSkipsScheduled() {
  Fixture    f;
  const auto id = util::GenerateUUID();
  SeedCommands(*f.memory, util::ToString(id), {"now"});
  SeedScheduledCommands(*f.memory, util::ToString(id), {{"later", 5}});

  f.bus->on_send = [](const std::vector<outbox::v1::Envelope>&) { throw util::DeliveryFailure("down"); };
  try {
    f.publisher->FlushCommands(id, {});
  } catch (const util::DeliveryFailure&) {
  }
  assert(f.bus->Scheduled().empty());
  assert(CountPendingScheduled(*f.memory, util::ToString(id)) == 1);
}

void TestCancelledFlushLeavesRows() {
  Fixture    f;
  const auto id = util::GenerateUUID();
  SeedCommands(*f.memory, util::ToString(id), {"one"});

  std::stop_source source;
  source.request_stop();

  bool threw = false;
  try {
    f.publisher->FlushCommands(id, source.get_token());
  } catch (const util::Cancelled&) {
    threw = true;
  }
  assert(threw);
  assert(f.bus->Batches().empty());
  assert(CountPending(*f.memory, util::ToString(id)) == 1);
}

} // namespace

int main() {
  TestFlushSendsOneOrderedBatchThenDeletes();
  TestFlushOfInstanceWithoutRowsSendsNothing();
  TestEmptyIdIsRejectedBeforeAnyIo();
  TestSendFailureKeepsEveryRow();
  TestRetryReusesStoredMessageIds();
  TestConcurrentlyDeletedRowCountsAsSuccess();
  TestConcurrentFlushesOfOneInstanceBothSucceed();
  TestDeleteErrorOtherThanNotFoundFailsFlush();
  TestCorrelationIdIsCarried();
  TestScheduledCommandsAreSentOneByOneWithTheirTime();
  TestScheduledFailureKeepsUnattemptedRows();
  TestImmediateFailureSkipsScheduled();
  TestCancelledFlushLeavesRows();

  std::cout << "outbox_unit_command_flush: pass\n";
  return 0;
}
