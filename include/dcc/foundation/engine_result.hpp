#pragma once

/// @file engine_result.hpp
/// @brief EngineResult<T> alias used by every fallible engine operation.

#include "dcc/core/result.hpp"
#include "dcc/foundation/engine_error.hpp"

namespace dcc::foundation {

/// Result type specialized with EngineError.
///
/// Example:
/// @code
///   EngineResult<int> halve(int amount) {
///       if (amount < 0) {
///           return EngineResult<int>::err(
///               EngineError(ErrorCode::NegativeAmount, "amount must be >= 0"));
///       }
///       return EngineResult<int>::ok(amount / 2);
///   }
/// @endcode
template <typename T>
using EngineResult = dcc::Result<T, EngineError>;

/// Shorthand for building an error result.
template <typename T>
[[nodiscard]] EngineResult<T> fail(ErrorCode code, std::string message) {
    return EngineResult<T>::err(EngineError(code, std::move(message)));
}

}  // namespace dcc::foundation
