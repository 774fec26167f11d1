#pragma once

#include "ragsync/config/schema.hpp"
#include "ragsync/observability/observer.hpp"

#include <memory>

namespace ragsync::observability {

/// Builds the backend named by `observability.backend`. Unknown names fall back to the log
/// backend; an unparsable level falls back to info.
[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace ragsync::observability
