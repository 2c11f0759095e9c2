#pragma once

#include <cstdint>

namespace starlane {

// -----------------------------------------------------------------------------
// ITimeProvider - abstract time source
// -----------------------------------------------------------------------------
//
// @brief  Source of "now" for every timestamp the core writes: turn
//         opened/closed times, order finalized_at, event created_at.
//
// @details
// Components receive `const ITimeProvider&` and never read the system clock
// directly. The executable injects LiveTimeProvider; tests inject
// SimulationTimeProvider so that timestamps are exact and repeatable.
//
// Thread-safety contract:
//   Implementations must allow concurrent now_ms() calls from any thread.
//
// Ownership:
//   Borrowed by reference; the provider outlives every component using it.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // Milliseconds since the Unix epoch.
  virtual std::int64_t now_ms() const = 0;
};

}  // namespace starlane
