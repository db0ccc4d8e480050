#pragma once

#include "distill/config/schema.hpp"
#include "distill/observability/observer.hpp"

#include <memory>

namespace distill::observability {

[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace distill::observability
