// audit.cpp
#include "audit.h"
#include "errors.h"

#include <exception>
#include <iostream>
#include <utility>

namespace rostra {

void CollectingAuditSink::emit(const AuditEvent& event) {
  std::lock_guard<std::mutex> lk(mu_);
  events_.push_back(event);
}

std::vector<AuditEvent> CollectingAuditSink::events() const {
  std::lock_guard<std::mutex> lk(mu_);
  return events_;
}

QueuedAuditSink::QueuedAuditSink(std::shared_ptr<AuditSink> downstream, std::size_t max_queue)
    : downstream_(std::move(downstream)), max_queue_(max_queue) {
  thread_ = std::thread([this] { worker(); });
}

QueuedAuditSink::~QueuedAuditSink() {
  {
    std::lock_guard<std::mutex> lk(mu_);
    stop_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

void QueuedAuditSink::emit(const AuditEvent& event) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (queue_.size() >= max_queue_) {
      ++dropped_;
      return;
    }
    queue_.push_back(event);
  }
  cv_.notify_one();
}

void QueuedAuditSink::flush() {
  std::unique_lock<std::mutex> lk(mu_);
  idle_cv_.wait(lk, [this] { return queue_.empty() && !busy_; });
}

void QueuedAuditSink::worker() {
  std::unique_lock<std::mutex> lk(mu_);
  for (;;) {
    cv_.wait(lk, [this] { return stop_ || !queue_.empty(); });
    if (queue_.empty()) {
      if (stop_) break;
      continue;
    }
    AuditEvent ev = std::move(queue_.front());
    queue_.pop_front();
    busy_ = true;
    lk.unlock();
    try {
      if (downstream_) downstream_->emit(ev);
    } catch (const std::exception& e) {
      ++failed_;
      std::cerr << "[audit] downstream sink failed on stage " << ev.stage << ": " << e.what() << "\n";
    } catch (...) {
      ++failed_;
      std::cerr << "[audit] downstream sink failed on stage " << ev.stage << " (unknown exception)\n";
    }
    lk.lock();
    busy_ = false;
    if (queue_.empty()) idle_cv_.notify_all();
  }
  idle_cv_.notify_all();
}

void emit_safely(AuditSink* sink, const AuditEvent& event, bool verbose) {
  if (verbose) {
    std::cerr << "[audit] " << event.stage << " changed=" << event.cells_changed
              << " found=" << event.violations_found << " repaired=" << event.violations_repaired;
    if (!event.detail.empty()) std::cerr << " (" << event.detail << ")";
    std::cerr << "\n";
  }
  if (!sink) return;
  try {
    sink->emit(event);
  } catch (const std::exception& e) {
    std::cerr << "[audit] sink failed on stage " << event.stage << ": " << e.what() << "\n";
  } catch (...) {
    std::cerr << "[audit] sink failed on stage " << event.stage << " (unknown exception)\n";
  }
}

void check_cancelled(const CancellationToken* token, const std::string& next_stage) {
  if (token && token->cancelled()) throw RunCancelled(next_stage);
}

} // namespace rostra
