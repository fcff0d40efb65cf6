// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Time.hpp>

#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace callscribe
{

/// @brief A stored call summary.
struct CallSummary
{
    std::string path;
    std::vector<std::string> bullets;
};

/// @brief Picks 3 to 5 Markdown bullets from a transcript.
///
/// Bullets are the transcript's first sentences, split per line and after '.', '!' or '?'.
/// When there are fewer than three, the text is cut into three word chunks instead.
/// Bullets longer than 256 characters are shortened and end in an ellipsis.
/// @return The bullets, or InvalidArgument for an empty or too short transcript.
[[nodiscard]] auto buildSummaryBullets(std::string_view transcript) -> Result<std::vector<std::string>>;

/// @brief Renders one "- <bullet>" line per bullet.
[[nodiscard]] auto formatSummaryMarkdown(std::vector<std::string> const& bullets) -> std::string;

/// @brief Returns "<directory>/YYYY/MM/DD/call_<sanitized call id>_YYYYMMDDTHHMMSSZ.md".
[[nodiscard]] auto summaryPathFor(std::filesystem::path const& directory, std::string_view callId, Timestamp createdAt)
    -> std::filesystem::path;

/// @brief Writes Markdown summaries of finished transcripts.
class CallSummarizer
{
  public:
    using Clock = std::function<Timestamp()>;

    explicit CallSummarizer(std::filesystem::path directory, Clock clock = {});

    /// @brief Summarizes @p transcript and stores the result under the summaries directory.
    [[nodiscard]] auto summarize(std::string_view callId, std::string_view transcript) const -> Result<CallSummary>;

    /// @brief Reads the transcript at @p transcriptPath (a local path or file:// URL) and summarizes it.
    [[nodiscard]] auto summarizeFile(std::string_view callId, std::string_view transcriptPath) const
        -> Result<CallSummary>;

    [[nodiscard]] auto directory() const noexcept -> std::filesystem::path const& { return _directory; }

  private:
    std::filesystem::path _directory;
    Clock _clock;
};

} // namespace callscribe
