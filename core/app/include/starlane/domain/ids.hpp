#pragma once

#include <cstdint>
#include <string>

namespace starlane {

// Row identifiers. All numeric ids come from the store's IdGenerator and
// start at 1; 0 means "unset".
using GameId = std::uint64_t;
using PlayerId = std::uint64_t;
using UserId = std::uint64_t;
using TurnId = std::uint64_t;
using ShipId = std::uint64_t;
using EventId = std::uint64_t;
using OrderRowId = std::uint64_t;
using ClientOrderId = std::uint64_t;

// Stars are named by the galaxy topology provider, not by the store.
using StarId = std::string;

// Milliseconds since the Unix epoch, as returned by ITimeProvider::now_ms().
using TimestampMs = std::int64_t;

}  // namespace starlane
