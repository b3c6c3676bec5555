#ifndef RESULT_H
#define RESULT_H

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

/**
 * Failure kinds reported by the room and game layers.
 * httpStatus() folds them into the transport's status codes.
 */
enum class ErrorCode {
    VALIDATION,       // Missing or malformed request fields
    NOT_FOUND,        // Unknown room, game or player
    FORBIDDEN,        // Host-only action by a non-host, or sync by a non-member
    INVALID_STATE,    // Game already started, not enough players
    ROOM_FULL,
    OUT_OF_TURN,
    ILLEGAL_ACTION,   // Acting player already folded or all-in
    INVALID_AMOUNT,   // Raise not above the current bet
    INVALID_ACTION,   // Unknown action token
    INTERNAL
};

struct Error {
    ErrorCode code;
    std::string message;
};

/**
 * Maps an error to its HTTP status
 */
inline int httpStatus(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::NOT_FOUND: return 404;
        case ErrorCode::FORBIDDEN: return 403;
        case ErrorCode::INTERNAL: return 500;
        default: return 400;
    }
}

/**
 * Either a value or an Error. Callers branch on ok() instead of catching.
 */
template <typename T>
class Result {
private:
    std::optional<T> val;
    std::optional<Error> err;

    Result() = default;

public:
    static Result success(T value) {
        Result r;
        r.val = std::move(value);
        return r;
    }

    static Result failure(ErrorCode code, std::string message) {
        Result r;
        r.err = Error{code, std::move(message)};
        return r;
    }

    static Result failure(Error error) {
        Result r;
        r.err = std::move(error);
        return r;
    }

    [[nodiscard]] bool ok() const noexcept { return val.has_value(); }

    const T& value() const {
        if (!val) {
            throw std::logic_error("Result has no value: " + err->message);
        }
        return *val;
    }

    T& value() {
        if (!val) {
            throw std::logic_error("Result has no value: " + err->message);
        }
        return *val;
    }

    const Error& error() const {
        if (!err) {
            throw std::logic_error("Result has no error");
        }
        return *err;
    }
};

#endif // RESULT_H
