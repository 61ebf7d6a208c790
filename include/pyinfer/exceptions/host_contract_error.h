/***
 * Name: pyinfer::exceptions::HostContractError
 * Purpose: Exception raised when the host interpreter hands the engine an object it cannot classify.
 * Inputs: Error message
 * Outputs: Exception object
 * Theory of Operation: Only thrown when strict host contracts are enabled; lenient sessions log
 *   the breach and degrade to an `object` instance instead.
 */
#pragma once

#include <string>
#include <utility>

#include "pyinfer/exceptions/pyinfer_exception.h"

namespace pyinfer {
namespace exceptions {

class HostContractError : public PyinferException {
 public:
  explicit HostContractError(std::string msg) noexcept : PyinferException(std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace pyinfer
