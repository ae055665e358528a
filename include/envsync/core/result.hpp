#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace envsync {

enum class ErrorCode {
    InvalidArgument,
    NotFound,
    Io,
    Parse,
    VersionControl
};

constexpr std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::InvalidArgument: return "invalid argument";
        case ErrorCode::NotFound: return "not found";
        case ErrorCode::Io: return "i/o error";
        case ErrorCode::Parse: return "parse error";
        case ErrorCode::VersionControl: return "version control error";
    }
    return "unknown error";
}

struct Error {
    ErrorCode code = ErrorCode::Io;
    std::string message;
};

template<typename T>
class Result {
private:
    std::variant<T, Error> data_;

public:
    Result(T value) : data_(std::in_place_index<0>, std::move(value)) {}
    Result(Error error) : data_(std::in_place_index<1>, std::move(error)) {}

    bool is_ok() const { return data_.index() == 0; }
    bool is_error() const { return data_.index() == 1; }

    T& value() { return std::get<0>(data_); }
    const T& value() const { return std::get<0>(data_); }

    const Error& error() const { return std::get<1>(data_); }
    const std::string& message() const { return error().message; }

    T value_or(T default_value) const {
        return is_ok() ? value() : std::move(default_value);
    }
};

template<>
class Result<void> {
public:
    Result() = default;
    Result(Error error) : error_(std::move(error)) {}

    bool is_ok() const { return !error_.has_value(); }
    bool is_error() const { return error_.has_value(); }

    const Error& error() const { return error_.value(); }
    const std::string& message() const { return error_->message; }

private:
    std::optional<Error> error_;
};

template<typename T>
Result<T> Ok(T value) { return Result<T>(std::move(value)); }

inline Result<void> Ok() { return Result<void>(); }

template<typename T>
Result<T> Err(ErrorCode code, std::string message) {
    return Result<T>(Error{code, std::move(message)});
}

} // namespace envsync
