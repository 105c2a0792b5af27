// include/rebalance_ngin/core/error.hpp

#pragma once

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

namespace rebalance_ngin {

/**
 * @brief Error codes for the rebalancing engine
 * Defines all possible error conditions that can occur
 */
enum class ErrorCode {
    NONE = 0,
    UNKNOWN_ERROR = 1,
    INVALID_ARGUMENT = 2,

    // Data errors
    INVALID_DATA = 3,
    CONVERSION_ERROR = 4,

    // Rebalancing errors
    CONFIGURATION_ERROR = 5,
    RECONCILIATION_FAILURE = 6,

    // File and I/O errors
    FILE_NOT_FOUND = 7,
    FILE_IO_ERROR = 8,

    // JSON and parsing errors
    JSON_PARSE_ERROR = 9
};

inline std::string error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE:
            return "NONE";
        case ErrorCode::INVALID_ARGUMENT:
            return "INVALID_ARGUMENT";
        case ErrorCode::INVALID_DATA:
            return "INVALID_DATA";
        case ErrorCode::CONVERSION_ERROR:
            return "CONVERSION_ERROR";
        case ErrorCode::CONFIGURATION_ERROR:
            return "CONFIGURATION_ERROR";
        case ErrorCode::RECONCILIATION_FAILURE:
            return "RECONCILIATION_FAILURE";
        case ErrorCode::FILE_NOT_FOUND:
            return "FILE_NOT_FOUND";
        case ErrorCode::FILE_IO_ERROR:
            return "FILE_IO_ERROR";
        case ErrorCode::JSON_PARSE_ERROR:
            return "JSON_PARSE_ERROR";
        default:
            return "UNKNOWN_ERROR";
    }
}

/**
 * @brief Base error type for rebalance_ngin errors
 */
class RebalanceError : public std::runtime_error {
public:
    /**
     * @brief Constructor for RebalanceError
     * @param code The error code
     * @param message Detailed error message
     * @param component Component where error occurred
     */
    RebalanceError(ErrorCode code, const std::string& message, const std::string& component = "")
        : std::runtime_error(message), code_(code), component_(component) {}

    virtual ~RebalanceError() = default;

    /**
     * @brief Get the error code
     * @return ErrorCode representing the type of error
     */
    ErrorCode code() const noexcept {
        return code_;
    }

    /**
     * @brief Get the component where error occurred
     * @return String identifying the component
     */
    const std::string& component() const noexcept {
        return component_;
    }

    /**
     * @brief Convert error to string representation
     * @return Formatted error string
     */
    std::string to_string() const {
        return "Error in " + component_ + ": " + what() + " (Code: " +
               std::to_string(static_cast<int>(code_)) + ")";
    }

private:
    ErrorCode code_;
    std::string component_;
};

/**
 * @brief Unresolved balance or debt that no node of a subtree can absorb
 *
 * The amount is the formatted Decimal. Positive amounts are value the subtree
 * holds above its budget, negative amounts are budget it could not place.
 */
class ReconciliationFailure : public RebalanceError {
public:
    ReconciliationFailure(std::string unresolved_amount, std::string subtree,
                          const std::string& message, const std::string& component = "")
        : RebalanceError(ErrorCode::RECONCILIATION_FAILURE, message, component),
          unresolved_amount_(std::move(unresolved_amount)),
          subtree_(std::move(subtree)) {}

    /**
     * @brief Unresolved amount in the reporting currency
     */
    const std::string& unresolved_amount() const noexcept {
        return unresolved_amount_;
    }

    /**
     * @brief Full name of the subtree where the amount originated
     */
    const std::string& subtree() const noexcept {
        return subtree_;
    }

private:
    std::string unresolved_amount_;
    std::string subtree_;
};

/**
 * @brief Result type for operations that can fail
 * @tparam T The type of the successful result
 */
template <typename T>
class Result {
public:
    /**
     * @brief Constructor for success case
     * @param value The successful result
     * @tparam U The type of the successful result
     */
    template <typename U = T>
    Result(U&& value) : value_(std::forward<U>(value)), error_(nullptr) {}

    /**
     * @brief Constructor for error case
     * @param error The error that occurred
     */
    Result(std::unique_ptr<RebalanceError> error) : error_(std::move(error)) {}

    Result(Result&& other) noexcept
        : value_(std::move(other.value_)), error_(std::move(other.error_)) {}

    Result& operator=(Result&& other) noexcept {
        if (this != &other) {
            value_ = std::move(other.value_);
            error_ = std::move(other.error_);
        }
        return *this;
    }

    Result(const Result&) = delete;
    Result& operator=(const Result&) = delete;

    /**
     * @brief Check if result represents success
     * @return true if operation was successful
     */
    bool is_ok() const {
        return error_ == nullptr;
    }

    /**
     * @brief Check if result represents error
     * @return true if operation failed
     */
    bool is_error() const {
        return error_ != nullptr;
    }

    /**
     * @brief Get the success value
     * @return Reference to the contained value
     * @throws RebalanceError if result represents an error
     */
    const T& value() const {
        if (error_)
            throw *error_;
        return value_;
    }

    /**
     * @brief Get the error if present
     * @return Pointer to the error, or nullptr if success
     */
    const RebalanceError* error() const {
        return error_.get();
    }

    /**
     * @brief Release ownership of the error, leaving the result empty
     */
    std::unique_ptr<RebalanceError> take_error() {
        return std::move(error_);
    }

private:
    T value_;
    std::unique_ptr<RebalanceError> error_;
};

// Specialization for void
template <>
class Result<void> {
public:
    Result() : error_(nullptr) {}
    Result(std::unique_ptr<RebalanceError> error) : error_(std::move(error)) {}

    bool is_ok() const {
        return error_ == nullptr;
    }
    bool is_error() const {
        return error_ != nullptr;
    }

    void value() const {
        if (error_)
            throw *error_;
    }

    const RebalanceError* error() const {
        return error_.get();
    }

    std::unique_ptr<RebalanceError> take_error() {
        return std::move(error_);
    }

private:
    std::unique_ptr<RebalanceError> error_;
};

/**
 * @brief Helper for creating error results
 * @tparam T The type of the successful result
 * @param code The error code
 * @param message The error message
 * @param component The component where error occurred
 * @return Result representing the error
 */
template <typename T>
Result<T> make_error(ErrorCode code, const std::string& message,
                     const std::string& component = "") {
    return Result<T>(std::make_unique<RebalanceError>(code, message, component));
}

/**
 * @brief Helper for creating reconciliation failures
 * @param unresolved_amount Amount that could not be placed, formatted
 * @param subtree Full name of the originating subtree
 * @param component The component where the failure was detected
 */
template <typename T>
Result<T> make_reconciliation_failure(const std::string& unresolved_amount,
                                      const std::string& subtree,
                                      const std::string& component = "") {
    std::unique_ptr<RebalanceError> error = std::make_unique<ReconciliationFailure>(
        unresolved_amount, subtree,
        "Unable to reconcile " + subtree + ": " + unresolved_amount + " left unresolved",
        component);
    return Result<T>(std::move(error));
}

/**
 * @brief Re-wrap the error of one result into a result of another type
 */
template <typename T, typename U>
Result<T> forward_error(Result<U>& result) {
    return Result<T>(result.take_error());
}

}  // namespace rebalance_ngin
