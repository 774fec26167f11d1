#include "ragsync/observability/factory.hpp"

#include "ragsync/common/fs.hpp"
#include "ragsync/observability/log_observer.hpp"
#include "ragsync/observability/multi_observer.hpp"
#include "ragsync/observability/noop_observer.hpp"

#include <sstream>

namespace ragsync::observability {

namespace {

std::unique_ptr<IObserver> create_backend(const std::string &name, const LogLevel level) {
  if (name.empty() || name == "none" || name == "noop") {
    return std::make_unique<NoopObserver>();
  }
  return std::make_unique<LogObserver>(level);
}

} // namespace

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  const auto &settings = config.observability;
  const LogLevel level =
      parse_log_level(common::to_lower(common::trim(settings.level))).value_or(LogLevel::Info);
  const std::string backend = common::to_lower(common::trim(settings.backend));
  if (backend.find(',') == std::string::npos) {
    return create_backend(backend, level);
  }

  MultiObserver multi;
  std::stringstream stream(backend);
  std::string part;
  while (std::getline(stream, part, ',')) {
    multi.add(create_backend(common::trim(part), level));
  }
  if (multi.size() == 0) {
    return std::make_unique<NoopObserver>();
  }
  if (multi.size() == 1) {
    return std::move(multi.release().front());
  }
  return std::make_unique<MultiObserver>(multi.release());
}

} // namespace ragsync::observability
