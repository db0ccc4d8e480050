#include "distill/observability/log_observer.hpp"

#include <iostream>
#include <type_traits>

namespace distill::observability {

LogObserver::LogObserver() : out_(&std::cerr) {}

LogObserver::LogObserver(std::ostream &out) : out_(&out) {}

void LogObserver::log_line(const std::string_view level, const std::string &message) {
  std::lock_guard<std::mutex> lock(mutex_);
  *out_ << "[" << level << "] " << message << "\n";
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, BatchStartEvent>) {
          log_line("INFO", "batch.start id=" + evt.batch_id +
                               " items=" + std::to_string(evt.item_count));
        } else if constexpr (std::is_same_v<T, BatchEndEvent>) {
          log_line("INFO", "batch.end id=" + evt.batch_id +
                               " duration_ms=" + std::to_string(evt.duration.count()) +
                               " include=" + std::to_string(evt.included) +
                               " exclude=" + std::to_string(evt.excluded) +
                               " review=" + std::to_string(evt.manual_review) +
                               " skipped=" + std::to_string(evt.skipped) +
                               " degraded=" + std::to_string(evt.degraded));
        } else if constexpr (std::is_same_v<T, StageEvent>) {
          log_line("DEBUG", "stage." + evt.stage +
                                " duration_ms=" + std::to_string(evt.duration.count()));
        } else if constexpr (std::is_same_v<T, ProviderCallEvent>) {
          log_line(evt.success ? "DEBUG" : "WARN",
                   "provider.call name=" + evt.provider + " op=" + evt.operation +
                       " duration_ms=" + std::to_string(evt.duration.count()) +
                       " success=" + (evt.success ? std::string("true") : std::string("false")));
        } else if constexpr (std::is_same_v<T, WarningEvent>) {
          log_line("WARN", evt.component + ": " + evt.message);
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line("ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, StageLatencyMetric>) {
          log_line("DEBUG", "metric.stage_latency_ms." + m.stage + "=" +
                                std::to_string(m.latency.count()));
        } else if constexpr (std::is_same_v<T, ClusterCountMetric>) {
          log_line("DEBUG", "metric.clusters=" + std::to_string(m.count));
        } else if constexpr (std::is_same_v<T, ItemsProcessedMetric>) {
          log_line("DEBUG", "metric.items_processed=" + std::to_string(m.count));
        }
      },
      metric);
}

void LogObserver::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  out_->flush();
}

} // namespace distill::observability
