#pragma once

#include "distill/observability/observer.hpp"

#include <mutex>
#include <ostream>

namespace distill::observability {

/// Writes `[LEVEL] message` lines; stderr unless another stream is supplied.
class LogObserver final : public IObserver {
public:
  LogObserver();
  explicit LogObserver(std::ostream &out);

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "log"; }

private:
  void log_line(std::string_view level, const std::string &message);

  std::ostream *out_;
  std::mutex mutex_;
};

} // namespace distill::observability
