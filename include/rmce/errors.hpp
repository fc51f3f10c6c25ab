#pragma once

/// @file include/rmce/errors.hpp
/// @brief Error taxonomy for the RMCE engines.
///
/// Every failure of a public engine call is reported by throwing a subclass of
/// `rmce::Error`. The `code()` accessor lets a batch caller tally failures by
/// kind without a cascade of catch clauses. Internal helpers whose result may
/// merely be undefined (percentile of an empty span, singular solve) return
/// `std::optional` instead and the caller applies the documented default.

#include <stdexcept>
#include <string>
#include <string_view>

namespace rmce {

enum class ErrorCode {
    InsufficientData,     ///< Fewer than 2 raw observations
    InsufficientHistory,  ///< Below the stage minimum (50 regime / 30 simulation)
    InvalidParameter,     ///< Non-positive price, path count or horizon; bad config
    EmptyEnsemble,        ///< Risk metrics requested on zero paths
    InvalidSeries,        ///< Unordered dates, non-positive or non-finite values
    Cancelled,            ///< Cooperative cancellation observed
};

[[nodiscard]] constexpr std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::InsufficientData:    return "InsufficientData";
        case ErrorCode::InsufficientHistory: return "InsufficientHistory";
        case ErrorCode::InvalidParameter:    return "InvalidParameter";
        case ErrorCode::EmptyEnsemble:       return "EmptyEnsemble";
        case ErrorCode::InvalidSeries:       return "InvalidSeries";
        case ErrorCode::Cancelled:           return "Cancelled";
    }
    return "Unknown";
}

/// Base class of every RMCE error.
class Error : public std::runtime_error {
public:
    Error(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

class InsufficientDataError : public Error {
public:
    explicit InsufficientDataError(const std::string& message)
        : Error(ErrorCode::InsufficientData, message) {}
};

class InsufficientHistoryError : public Error {
public:
    explicit InsufficientHistoryError(const std::string& message)
        : Error(ErrorCode::InsufficientHistory, message) {}
};

class InvalidParameterError : public Error {
public:
    explicit InvalidParameterError(const std::string& message)
        : Error(ErrorCode::InvalidParameter, message) {}
};

class EmptyEnsembleError : public Error {
public:
    explicit EmptyEnsembleError(const std::string& message)
        : Error(ErrorCode::EmptyEnsemble, message) {}
};

class InvalidSeriesError : public Error {
public:
    explicit InvalidSeriesError(const std::string& message)
        : Error(ErrorCode::InvalidSeries, message) {}
};

class OperationCancelledError : public Error {
public:
    explicit OperationCancelledError(const std::string& message)
        : Error(ErrorCode::Cancelled, message) {}
};

} // namespace rmce
