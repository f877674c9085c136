#pragma once

#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace cloudmove {

enum class ErrorCode {
    ProbeFailed,
    CopyFailed,
    DeleteFailed,
    PruneFailed,
    InvalidConfig,
    InvalidArgument,
    RootUnavailable,
    Io
};

inline const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::ProbeFailed: return "ProbeFailed";
        case ErrorCode::CopyFailed: return "CopyFailed";
        case ErrorCode::DeleteFailed: return "DeleteFailed";
        case ErrorCode::PruneFailed: return "PruneFailed";
        case ErrorCode::InvalidConfig: return "InvalidConfig";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::RootUnavailable: return "RootUnavailable";
        case ErrorCode::Io: return "Io";
    }
    return "Unknown";
}

/**
 * @brief Failure reported by a pipeline step
 */
struct Error {
    ErrorCode code = ErrorCode::Io;
    std::string message;

    Error() = default;
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}
};

// Wrappers so Result<T, E> stays unambiguous when T and E are the same type
template<typename T>
struct OkValue {
    T value;
    explicit OkValue(T v) : value(std::move(v)) {}
};

template<typename E>
struct ErrValue {
    E error;
    explicit ErrValue(E e) : error(std::move(e)) {}
};

template<typename T, typename E = Error>
class Result {
public:
    Result(OkValue<T> ok) : data_(std::in_place_index<0>, std::move(ok.value)) {}
    Result(ErrValue<E> err) : data_(std::in_place_index<1>, std::move(err.error)) {}

    bool is_ok() const { return data_.index() == 0; }
    bool is_error() const { return data_.index() == 1; }

    T& value() { return std::get<0>(data_); }
    const T& value() const { return std::get<0>(data_); }

    E& error() { return std::get<1>(data_); }
    const E& error() const { return std::get<1>(data_); }

    T value_or(T fallback) const {
        return is_ok() ? value() : std::move(fallback);
    }

private:
    std::variant<T, E> data_;
};

template<typename E>
class Result<void, E> {
public:
    Result() = default;
    Result(ErrValue<E> err) : error_(std::move(err.error)) {}

    bool is_ok() const { return !error_.has_value(); }
    bool is_error() const { return error_.has_value(); }

    const E& error() const { return error_.value(); }

private:
    std::optional<E> error_;
};

template<typename T>
Result<T> Ok(T value) { return Result<T>(OkValue<T>(std::move(value))); }

inline Result<void> Ok() { return Result<void>(); }

template<typename T, typename E = Error>
Result<T, E> Err(E error) { return Result<T, E>(ErrValue<E>(std::move(error))); }

template<typename T>
Result<T> Err(ErrorCode code, std::string message) {
    return Result<T>(ErrValue<Error>(Error{code, std::move(message)}));
}

} // namespace cloudmove
