#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace distill::observability {

struct BatchStartEvent {
  std::string batch_id;
  std::uint64_t item_count = 0;
};

struct BatchEndEvent {
  std::string batch_id;
  std::chrono::milliseconds duration{0};
  std::uint64_t included = 0;
  std::uint64_t excluded = 0;
  std::uint64_t manual_review = 0;
  std::uint64_t skipped = 0;
  std::uint64_t degraded = 0;
};

struct StageEvent {
  std::string stage;
  std::chrono::milliseconds duration{0};
};

struct ProviderCallEvent {
  std::string provider;
  std::string operation;
  std::chrono::milliseconds duration{0};
  bool success = false;
};

struct WarningEvent {
  std::string component;
  std::string message;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent = std::variant<BatchStartEvent, BatchEndEvent, StageEvent, ProviderCallEvent,
                                   WarningEvent, ErrorEvent>;

struct StageLatencyMetric {
  std::string stage;
  std::chrono::milliseconds latency{0};
};

struct ClusterCountMetric {
  std::uint64_t count = 0;
};

struct ItemsProcessedMetric {
  std::uint64_t count = 0;
};

using ObserverMetric = std::variant<StageLatencyMetric, ClusterCountMetric, ItemsProcessedMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace distill::observability
