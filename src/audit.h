// audit.h
#pragma once
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace rostra {

struct AuditEvent {
  std::string stage;
  int cells_changed = 0;
  int violations_found = 0;
  int violations_repaired = 0;
  std::string detail;
};

// Receiver of per-stage events. Implementations may throw; the engine never lets that fail a run.
class AuditSink {
 public:
  virtual ~AuditSink() = default;
  virtual void emit(const AuditEvent& event) = 0;
};

// Keeps every event in memory. Thread-safe.
class CollectingAuditSink : public AuditSink {
 public:
  void emit(const AuditEvent& event) override;
  std::vector<AuditEvent> events() const;

 private:
  mutable std::mutex mu_;
  std::vector<AuditEvent> events_;
};

// Hands events to a downstream sink on its own worker thread so emit() returns
// immediately. When the queue is full new events are dropped and counted.
class QueuedAuditSink : public AuditSink {
 public:
  explicit QueuedAuditSink(std::shared_ptr<AuditSink> downstream, std::size_t max_queue = 1024);
  ~QueuedAuditSink() override;

  QueuedAuditSink(const QueuedAuditSink&) = delete;
  QueuedAuditSink& operator=(const QueuedAuditSink&) = delete;

  void emit(const AuditEvent& event) override;

  // Blocks until every queued event has been delivered.
  void flush();

  std::size_t dropped() const { return dropped_.load(); }
  std::size_t failed() const { return failed_.load(); }

 private:
  void worker();

  std::shared_ptr<AuditSink> downstream_;
  std::size_t max_queue_;
  std::mutex mu_;
  std::condition_variable cv_;
  std::condition_variable idle_cv_;
  std::deque<AuditEvent> queue_;
  bool stop_ = false;
  bool busy_ = false;
  std::atomic<std::size_t> dropped_{0};
  std::atomic<std::size_t> failed_{0};
  std::thread thread_;
};

// Delivers to sink (may be null) and logs, never propagates, sink failures.
void emit_safely(AuditSink* sink, const AuditEvent& event, bool verbose);

// Cooperative cancellation, observed between pipeline stages.
class CancellationToken {
 public:
  void cancel() { flag_.store(true); }
  bool cancelled() const { return flag_.load(); }

 private:
  std::atomic<bool> flag_{false};
};

// Throws RunCancelled when token is set.
void check_cancelled(const CancellationToken* token, const std::string& next_stage);

} // namespace rostra
