#include "distill/observability/global.hpp"

#include <mutex>

namespace distill::observability {

namespace {

std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  if (g_observer != nullptr) {
    g_observer->flush();
  }
  g_observer = std::move(observer);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

void record_event(const ObserverEvent &event) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_batch_start(const std::string &batch_id, const std::uint64_t item_count) {
  record_event(BatchStartEvent{.batch_id = batch_id, .item_count = item_count});
}

void record_stage(const std::string &stage, const std::chrono::milliseconds duration) {
  record_event(StageEvent{.stage = stage, .duration = duration});
  record_metric(StageLatencyMetric{.stage = stage, .latency = duration});
}

void record_provider_call(const std::string &provider, const std::string &operation,
                          const std::chrono::milliseconds duration, const bool success) {
  record_event(ProviderCallEvent{
      .provider = provider, .operation = operation, .duration = duration, .success = success});
}

void record_warning(const std::string &component, const std::string &message) {
  record_event(WarningEvent{.component = component, .message = message});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

StageTimer::StageTimer(std::string stage)
    : stage_(std::move(stage)), start_(std::chrono::steady_clock::now()) {}

StageTimer::~StageTimer() {
  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start_);
  record_stage(stage_, elapsed);
}

} // namespace distill::observability
