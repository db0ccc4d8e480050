#pragma once

#include "distill/observability/observer.hpp"

#include <memory>

namespace distill::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_batch_start(const std::string &batch_id, std::uint64_t item_count);
void record_stage(const std::string &stage, std::chrono::milliseconds duration);
void record_provider_call(const std::string &provider, const std::string &operation,
                          std::chrono::milliseconds duration, bool success);
void record_warning(const std::string &component, const std::string &message);
void record_error(const std::string &component, const std::string &message);

/// Emits a StageEvent and a StageLatencyMetric when it goes out of scope.
class StageTimer {
public:
  explicit StageTimer(std::string stage);
  ~StageTimer();

  StageTimer(const StageTimer &) = delete;
  StageTimer &operator=(const StageTimer &) = delete;

private:
  std::string stage_;
  std::chrono::steady_clock::time_point start_;
};

} // namespace distill::observability
