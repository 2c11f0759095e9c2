#pragma once

#include <stdexcept>
#include <string>

namespace starlane {

// -----------------------------------------------------------------------------
// Error taxonomy
// -----------------------------------------------------------------------------
//
// @brief  Exceptions thrown by the stores and services of the turn core.
//
// @details
//   ValidationError       Malformed input, rejected before any write.
//   InvalidStandingOrder  Standing-order template out of range.
//   NotFoundError         Unknown game, player, turn, star or draft.
//   ConflictError         The target exists but is in the wrong state
//                         (turn not open, game not running).
//
// Economic shortfall is never an error: resolution caps or skips it.
// Per-item failures during resolution, materialization and AI execution are
// caught by their batch and collected, never rethrown.
//
// The command boundary (TurnEngine::executeCommand) maps each class to a
// JSON error code via errorCode().
// -----------------------------------------------------------------------------
class EngineError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class ValidationError : public EngineError {
 public:
  using EngineError::EngineError;
};

class InvalidStandingOrder : public ValidationError {
 public:
  using ValidationError::ValidationError;
};

class NotFoundError : public EngineError {
 public:
  using EngineError::EngineError;
};

class ConflictError : public EngineError {
 public:
  using EngineError::EngineError;
};

// "validation", "not_found", "conflict" or "internal".
const char* errorCode(const std::exception& e);

}  // namespace starlane
