#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace bomcast::core {

/// Why a model could not produce a forecast.
enum class UnavailableReason {
	InsufficientHistory,
	NonConvergence,
	NumericalFailure
};

inline const char *toString(UnavailableReason reason) {
	switch (reason) {
	case UnavailableReason::InsufficientHistory:
		return "insufficient-history";
	case UnavailableReason::NonConvergence:
		return "non-convergence";
	case UnavailableReason::NumericalFailure:
		return "numerical-failure";
	}
	return "unknown";
}

/**
 * @class ModelResult
 * @brief Either a model output or the reason the model was unavailable.
 *
 * Model adapters return this instead of throwing, so callers branch on
 * available() rather than catching.
 */
template <typename T>
class ModelResult {
public:
	static ModelResult available(T value) {
		ModelResult result;
		result.value_ = std::move(value);
		return result;
	}

	static ModelResult unavailable(UnavailableReason reason, std::string message) {
		ModelResult result;
		result.reason_ = reason;
		result.message_ = std::move(message);
		return result;
	}

	bool isAvailable() const {
		return value_.has_value();
	}

	explicit operator bool() const {
		return isAvailable();
	}

	const T &value() const {
		if (!value_) {
			throw std::logic_error("ModelResult::value called on an unavailable result: " + message_);
		}
		return *value_;
	}

	/// Only meaningful when the result is unavailable.
	UnavailableReason reason() const {
		return reason_;
	}

	const std::string &message() const {
		return message_;
	}

private:
	ModelResult() = default;

	std::optional<T> value_;
	UnavailableReason reason_ = UnavailableReason::NumericalFailure;
	std::string message_;
};

/// Thrown by raw models when the series is too short for the configured order.
class InsufficientHistoryError : public std::invalid_argument {
public:
	using std::invalid_argument::invalid_argument;
};

/// Thrown by raw models when the bounded fit does not converge.
class ConvergenceError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

} // namespace bomcast::core
