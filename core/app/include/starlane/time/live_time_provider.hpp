#pragma once

#include "starlane/time/i_time_provider.hpp"

namespace starlane {

// -----------------------------------------------------------------------------
// LiveTimeProvider - wall-clock ITimeProvider
// -----------------------------------------------------------------------------
// Delegates to std::chrono::system_clock. Used by the starlane_engine
// executable.
// -----------------------------------------------------------------------------
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;
};

}  // namespace starlane
