/***
 * Name: pyinfer::exceptions::InvalidArgumentError
 * Purpose: Exception for caller contract violations (null entries, malformed names, bad options).
 * Inputs: Error message
 * Outputs: Exception object
 * Theory of Operation: Marker type deriving from PyinferException.
 */
#pragma once

#include <string>
#include <utility>

#include "pyinfer/exceptions/pyinfer_exception.h"

namespace pyinfer {
namespace exceptions {

class InvalidArgumentError : public PyinferException {
 public:
  explicit InvalidArgumentError(std::string msg) noexcept : PyinferException(std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace pyinfer
