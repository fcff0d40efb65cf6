// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <queue/Job.hpp>

#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace callscribe
{

/// @brief Where a finished transcript was stored and which language it is in.
struct TranscriptResult
{
    std::string transcriptPath;
    std::optional<std::string> language;
};

/// @brief How a failed transcription attempt should be treated.
enum class FailureKind
{
    ClientError,    ///< The request itself is wrong (HTTP 4xx). Retrying cannot help.
    TransientError, ///< Network trouble, HTTP 5xx, or no status at all. Worth retrying.
    Unexpected,     ///< A provider threw. Retried like a transient error.
};

[[nodiscard]] constexpr auto failureKindName(FailureKind kind) -> std::string_view
{
    switch (kind)
    {
        case FailureKind::ClientError: return "client_error";
        case FailureKind::TransientError: return "transient_error";
        case FailureKind::Unexpected: return "unexpected";
    }
    return "unexpected";
}

/// @brief Classifies an HTTP status: 400-499 is a client error, everything else is transient.
[[nodiscard]] constexpr auto classifyStatus(std::optional<int> statusCode) noexcept -> FailureKind
{
    if (statusCode && *statusCode >= 400 && *statusCode < 500)
        return FailureKind::ClientError;
    return FailureKind::TransientError;
}

/// @brief A failed transcription attempt.
struct TranscriptionFailure
{
    FailureKind kind = FailureKind::TransientError;
    std::optional<int> statusCode;
    std::string message;

    /// @brief Builds a failure whose kind follows from @p statusCode.
    [[nodiscard]] static auto fromStatus(std::optional<int> statusCode, std::string message) -> TranscriptionFailure
    {
        return TranscriptionFailure { classifyStatus(statusCode), statusCode, std::move(message) };
    }

    [[nodiscard]] static auto transient(std::string message) -> TranscriptionFailure
    {
        return TranscriptionFailure { FailureKind::TransientError, std::nullopt, std::move(message) };
    }

    [[nodiscard]] static auto unexpected(std::string message) -> TranscriptionFailure
    {
        return TranscriptionFailure { FailureKind::Unexpected, std::nullopt, std::move(message) };
    }
};

/// @brief Outcome of one transcription attempt.
using TranscriptionOutcome = std::expected<TranscriptResult, TranscriptionFailure>;

/// @brief A speech-to-text backend.
class TranscriptionProvider
{
  public:
    virtual ~TranscriptionProvider() = default;

    /// @brief Transcribes the job's recording and stores the transcript.
    [[nodiscard]] virtual auto transcribe(JobEnvelope const& job) -> TranscriptionOutcome = 0;
};

/// @brief Turns a call id into a safe file stem.
///
/// Characters other than ASCII letters, digits, '-' and '_' become '_'. Leading and trailing
/// '.' and '_' are stripped. An empty result becomes "transcript".
[[nodiscard]] auto sanitizeFileStem(std::string_view callId) -> std::string;

/// @brief Returns "<directory>/<sanitized call id>.txt", creating @p directory if needed.
[[nodiscard]] auto prepareTranscriptPath(std::filesystem::path const& directory, std::string_view callId)
    -> Result<std::filesystem::path>;

/// @brief Writes @p text (trimmed, newline-terminated) as the job's transcript.
[[nodiscard]] auto writeTranscript(std::filesystem::path const& directory, std::string_view callId, std::string_view text)
    -> Result<std::filesystem::path>;

} // namespace callscribe
