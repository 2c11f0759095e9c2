#pragma once

#include "starlane/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace starlane {

// -----------------------------------------------------------------------------
// SimulationTimeProvider - externally driven clock
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider whose time only moves when advance_time() or
//         advance_by() is called.
//
// @details
// Used by the test suites (and by tools that replay a recorded game) to get
// deterministic timestamps on turns, finals and events. Monotonicity is the
// caller's responsibility; advance_time() accepts any value.
//
// Thread model:
//   std::atomic<int64_t> storage; readers and writers may run on any thread.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  SimulationTimeProvider() = default;
  explicit SimulationTimeProvider(std::int64_t start_ms)
      : current_time_ms_(start_ms) {}

  std::int64_t now_ms() const override;

  void advance_time(std::int64_t new_time_ms);

  // Moves the clock forward by delta_ms and returns the new time.
  std::int64_t advance_by(std::int64_t delta_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_{0};
};

}  // namespace starlane
