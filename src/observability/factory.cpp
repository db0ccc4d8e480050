#include "distill/observability/factory.hpp"

#include "distill/common/fs.hpp"
#include "distill/observability/log_observer.hpp"
#include "distill/observability/multi_observer.hpp"

namespace distill::observability {

namespace {

std::unique_ptr<IObserver> observer_for(const std::string &backend) {
  if (backend.empty() || backend == "none" || backend == "noop") {
    return std::make_unique<NoopObserver>();
  }
  if (backend == "log") {
    return std::make_unique<LogObserver>();
  }
  return nullptr;
}

} // namespace

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  if (backend.find(',') == std::string::npos) {
    if (auto observer = observer_for(backend); observer != nullptr) {
      return observer;
    }
    return std::make_unique<LogObserver>();
  }

  auto multi = std::make_unique<MultiObserver>();
  for (const auto &part : common::split(backend, ',')) {
    multi->add(observer_for(part));
  }
  if (multi->size() == 0) {
    return std::make_unique<LogObserver>();
  }
  return multi;
}

} // namespace distill::observability
