// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <expected>
#include <format>
#include <string>
#include <string_view>

namespace callscribe
{

/// @brief Error codes for categorizing failures across the pipeline.
enum class ErrorCode
{
    Unknown,
    InvalidArgument,
    IoError,
    ConfigError,
    StoreError,
    ProtocolError,
    RecordError,
    TranscriptionError,
    AudioError,
    TimeoutError,
};

/// @brief Returns a short lowercase name for an error code.
[[nodiscard]] constexpr auto errorCodeName(ErrorCode code) -> std::string_view
{
    switch (code)
    {
        case ErrorCode::Unknown: return "unknown";
        case ErrorCode::InvalidArgument: return "invalid_argument";
        case ErrorCode::IoError: return "io_error";
        case ErrorCode::ConfigError: return "config_error";
        case ErrorCode::StoreError: return "store_error";
        case ErrorCode::ProtocolError: return "protocol_error";
        case ErrorCode::RecordError: return "record_error";
        case ErrorCode::TranscriptionError: return "transcription_error";
        case ErrorCode::AudioError: return "audio_error";
        case ErrorCode::TimeoutError: return "timeout_error";
    }
    return "unknown";
}

/// @brief Represents an error with a code and descriptive message.
struct Error
{
    ErrorCode code = ErrorCode::Unknown;
    std::string message;
};

/// @brief Result type for operations that return a value or an error.
/// @tparam T The success value type.
template <typename T>
using Result = std::expected<T, Error>;

/// @brief Result type for operations that return no value on success.
using VoidResult = std::expected<void, Error>;

/// @brief Creates an unexpected Error value for use with std::expected.
/// @param code The error code.
/// @param message A descriptive error message.
/// @return An unexpected Error.
[[nodiscard]] inline auto makeError(ErrorCode code, std::string message) -> std::unexpected<Error>
{
    return std::unexpected<Error>(Error { code, std::move(message) });
}

} // namespace callscribe

template <>
struct std::formatter<callscribe::Error>: std::formatter<std::string>
{
    auto format(const callscribe::Error& error, auto& ctx) const
    {
        return std::formatter<std::string>::format(
            std::format("[{}] {}", callscribe::errorCodeName(error.code), error.message), ctx);
    }
};
