/**
 * @file result.hpp
 * @brief Tagged success/error wrapper for infrastructure failures
 *
 * Every manager and executor operation that can fail for reasons unrelated
 * to the command itself (backend missing, malformed policy, pool exhausted)
 * returns a Result. A command that runs and fails is NOT an error: it is a
 * successful Result carrying an ExecutionResult with a non-zero exit code.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <utility>
#include <variant>
#include <stdexcept>

namespace warden {

/**
 * @enum ErrorKind
 * @brief Discriminator for infrastructure failures
 */
enum class ErrorKind {
    BACKEND_UNAVAILABLE,  ///< Backend absent or unreachable (fallback trigger)
    INVALID_POLICY,       ///< Policy cannot be honored (e.g. container without image)
    INVALID_REQUEST,      ///< Request is malformed (empty command, bad cwd)
    POOL_EXHAUSTED,       ///< No container slot freed before the deadline
    EXECUTION_FAILED,     ///< I/O or runtime failure while running the command
    CANCELLED             ///< Caller cancelled the execution
};

/**
 * @struct Error
 * @brief Failure payload of a Result
 */
struct Error {
    ErrorKind kind{ErrorKind::EXECUTION_FAILED};
    std::string message;
};

/// Printable name of an ErrorKind ("BACKEND_UNAVAILABLE", ...)
const char* ErrorKindToString(ErrorKind kind);

/**
 * @class Result
 * @brief Success value or Error, never both
 *
 * **Usage Example**:
 * @code
 * auto result = manager.Execute(request, policy);
 * if (!result) {
 *     spdlog::error("{}: {}", ErrorKindToString(result.GetError().kind),
 *                   result.GetError().message);
 *     return;
 * }
 * std::cout << result.Value().stdout_output;
 * @endcode
 */
template <typename T>
class Result {
public:
    static Result Success(T value) {
        return Result(std::in_place_index<0>, std::move(value));
    }

    static Result Failure(ErrorKind kind, std::string message) {
        return Result(std::in_place_index<1>, Error{kind, std::move(message)});
    }

    static Result Failure(Error error) {
        return Result(std::in_place_index<1>, std::move(error));
    }

    bool IsSuccess() const { return state_.index() == 0; }
    explicit operator bool() const { return IsSuccess(); }

    /// @throws std::logic_error if the Result holds an error
    const T& Value() const {
        if (!IsSuccess()) {
            throw std::logic_error("Result has no value: " + std::get<1>(state_).message);
        }
        return std::get<0>(state_);
    }

    T& Value() {
        if (!IsSuccess()) {
            throw std::logic_error("Result has no value: " + std::get<1>(state_).message);
        }
        return std::get<0>(state_);
    }

    /// @throws std::logic_error if the Result holds a value
    const Error& GetError() const {
        if (IsSuccess()) {
            throw std::logic_error("Result has no error");
        }
        return std::get<1>(state_);
    }

private:
    template <std::size_t I, typename U>
    Result(std::in_place_index_t<I> tag, U&& payload)
        : state_(tag, std::forward<U>(payload)) {}

    std::variant<T, Error> state_;
};

/**
 * @brief Result specialization for operations without a value
 */
template <>
class Result<void> {
public:
    static Result Success() { return Result(); }

    static Result Failure(ErrorKind kind, std::string message) {
        Result result;
        result.error_ = Error{kind, std::move(message)};
        result.ok_ = false;
        return result;
    }

    static Result Failure(Error error) {
        Result result;
        result.error_ = std::move(error);
        result.ok_ = false;
        return result;
    }

    bool IsSuccess() const { return ok_; }
    explicit operator bool() const { return ok_; }

    const Error& GetError() const {
        if (ok_) {
            throw std::logic_error("Result has no error");
        }
        return error_;
    }

private:
    Result() = default;

    bool ok_{true};
    Error error_;
};

} // namespace warden
