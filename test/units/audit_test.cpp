#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <thread>

#include "audit.h"
#include "errors.h"

using namespace rostra;

namespace
{

AuditEvent Event(std::string const & stage, int changed = 0)
{
  AuditEvent e;
  e.stage = stage;
  e.cells_changed = changed;
  return e;
}

class ThrowingSink : public AuditSink
{
public:
  void emit(AuditEvent const &) override
  {
    ++calls;
    throw std::runtime_error("audit store offline");
  }

  std::atomic<int> calls{0};
};

// Throws something that is not a std::exception.
class IntThrowingSink : public AuditSink
{
public:
  void emit(AuditEvent const &) override
  {
    ++calls;
    throw 42;
  }

  std::atomic<int> calls{0};
};

// Holds the worker until released so the queue can fill up.
class GateSink : public AuditSink
{
public:
  void emit(AuditEvent const & e) override
  {
    while (!open.load())
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
    inner.emit(e);
  }

  std::atomic<bool> open{false};
  CollectingAuditSink inner;
};

}  // namespace

TEST(AuditTest, CollectingSink_KeepsOrder)
{
  CollectingAuditSink sink;
  sink.emit(Event("lock"));
  sink.emit(Event("predict"));
  auto events = sink.events();
  ASSERT_EQ(events.size(), 2u);
  EXPECT_EQ(events[0].stage, "lock");
  EXPECT_EQ(events[1].stage, "predict");
}

TEST(AuditTest, QueuedSink_DeliversEverythingOnFlush)
{
  auto collected = std::make_shared<CollectingAuditSink>();
  QueuedAuditSink queued(collected);
  for (int i = 0; i < 20; ++i)
    queued.emit(Event("repair", i));
  queued.flush();

  auto events = collected->events();
  ASSERT_EQ(events.size(), 20u);
  EXPECT_EQ(events[19].cells_changed, 19);
  EXPECT_EQ(queued.dropped(), 0u);
}

TEST(AuditTest, QueuedSink_DownstreamFailuresCounted)
{
  auto failing = std::make_shared<ThrowingSink>();
  QueuedAuditSink queued(failing);
  queued.emit(Event("lock"));
  queued.emit(Event("validate"));
  queued.flush();

  EXPECT_EQ(failing->calls.load(), 2);
  EXPECT_EQ(queued.failed(), 2u);
}

TEST(AuditTest, QueuedSink_NonStandardThrowCountedAndWorkerSurvives)
{
  auto failing = std::make_shared<IntThrowingSink>();
  QueuedAuditSink queued(failing);
  queued.emit(Event("lock"));
  queued.emit(Event("repair"));
  queued.flush();
  queued.emit(Event("final_validate"));
  queued.flush();

  EXPECT_EQ(failing->calls.load(), 3);
  EXPECT_EQ(queued.failed(), 3u);
}

TEST(AuditTest, QueuedSink_FullQueueDropsNewEvents)
{
  auto gate = std::make_shared<GateSink>();
  QueuedAuditSink queued(gate, 2);

  // The first event may already sit with the worker; either way at most three fit.
  for (int i = 0; i < 10; ++i)
    queued.emit(Event("generate", i));
  gate->open = true;
  queued.flush();

  const std::size_t delivered = gate->inner.events().size();
  EXPECT_GE(queued.dropped(), 7u);
  EXPECT_EQ(delivered + queued.dropped(), 10u);
  EXPECT_EQ(gate->inner.events().front().cells_changed, 0);
}

TEST(AuditTest, EmitSafely_SwallowsSinkFailure)
{
  ThrowingSink sink;
  EXPECT_NO_THROW(emit_safely(&sink, Event("repair"), false));
  EXPECT_EQ(sink.calls.load(), 1);
  EXPECT_NO_THROW(emit_safely(nullptr, Event("repair"), false));
}

TEST(AuditTest, EmitSafely_SwallowsNonStandardThrow)
{
  IntThrowingSink sink;
  EXPECT_NO_THROW(emit_safely(&sink, Event("validate"), false));
  EXPECT_EQ(sink.calls.load(), 1);
}

TEST(AuditTest, CheckCancelled_ThrowsOnlyWhenSet)
{
  CancellationToken token;
  EXPECT_NO_THROW(check_cancelled(&token, "generate"));
  EXPECT_NO_THROW(check_cancelled(nullptr, "generate"));

  token.cancel();
  try
  {
    check_cancelled(&token, "repair");
    FAIL() << "expected RunCancelled";
  }
  catch (RunCancelled const & e)
  {
    EXPECT_EQ(e.stage(), "repair");
  }
}
