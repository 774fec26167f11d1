#pragma once

#include "ragsync/common/time.hpp"

namespace ragsync::sync {

class SyncClock {
public:
  virtual ~SyncClock() = default;
  [[nodiscard]] virtual common::TimePoint now() const = 0;
};

class SystemSyncClock final : public SyncClock {
public:
  [[nodiscard]] common::TimePoint now() const override { return std::chrono::system_clock::now(); }
};

} // namespace ragsync::sync
