#pragma once

#include <cstddef>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace schedfmt {

enum class ErrorCode {
    Unknown = 1,
    UnexpectedToken,
    WildcardConflict,
    OutOfBounds,
    TrailingInput,
    NumericOverflow,
    InvalidStep,
    InvalidConfig,
    InvalidArgument,
    IoError,
};

class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    Error(ErrorCode code, std::string message, std::string detail)
        : code_(code), message_(std::move(message)), detail_(std::move(detail)) {}

    [[nodiscard]] auto code() const noexcept -> ErrorCode { return code_; }
    [[nodiscard]] auto message() const noexcept -> std::string_view { return message_; }
    [[nodiscard]] auto detail() const noexcept -> std::string_view { return detail_; }

    /// Input offset at which parsing failed, if the error came from the parser.
    [[nodiscard]] auto offset() const noexcept -> std::optional<std::size_t> { return offset_; }

    auto at(std::size_t offset) && -> Error {
        offset_ = offset;
        return std::move(*this);
    }

    void set_detail(std::string detail) { detail_ = std::move(detail); }

    [[nodiscard]] auto what() const -> std::string {
        if (detail_.empty()) return message_;
        return message_ + ": " + detail_;
    }

private:
    ErrorCode code_;
    std::string message_;
    std::string detail_;
    std::optional<std::size_t> offset_;
};

template <typename T>
using Result = std::expected<T, Error>;

using VoidResult = std::expected<void, Error>;

inline auto make_error(ErrorCode code, std::string message) -> Error {
    return Error(code, std::move(message));
}

inline auto make_error(ErrorCode code, std::string message, std::string detail) -> Error {
    return Error(code, std::move(message), std::move(detail));
}

/// Returns true for errors raised by field validation rather than by the
/// grammar itself.
inline auto is_validation_error(const Error& err) noexcept -> bool {
    return err.code() == ErrorCode::OutOfBounds ||
           err.code() == ErrorCode::WildcardConflict;
}

inline auto error_code_to_string(ErrorCode code) -> std::string_view {
    switch (code) {
        case ErrorCode::Unknown: return "UNKNOWN";
        case ErrorCode::UnexpectedToken: return "UNEXPECTED_TOKEN";
        case ErrorCode::WildcardConflict: return "WILDCARD_CONFLICT";
        case ErrorCode::OutOfBounds: return "OUT_OF_BOUNDS";
        case ErrorCode::TrailingInput: return "TRAILING_INPUT";
        case ErrorCode::NumericOverflow: return "NUMERIC_OVERFLOW";
        case ErrorCode::InvalidStep: return "INVALID_STEP";
        case ErrorCode::InvalidConfig: return "INVALID_CONFIG";
        case ErrorCode::InvalidArgument: return "INVALID_ARGUMENT";
        case ErrorCode::IoError: return "IO_ERROR";
        default: return "UNKNOWN";
    }
}

} // namespace schedfmt
