// SPDX-License-Identifier: Apache-2.0
#include "PlaceholderProvider.hpp"

#include <format>
#include <fstream>

namespace callscribe
{

PlaceholderProvider::PlaceholderProvider(std::filesystem::path transcriptsDir):
    _transcriptsDir(std::move(transcriptsDir))
{
}

auto PlaceholderProvider::transcribe(JobEnvelope const& job) -> TranscriptionOutcome
{
    auto path = prepareTranscriptPath(_transcriptsDir, job.callId);
    if (!path)
        return std::unexpected(TranscriptionFailure::transient(path.error().message));

    auto ec = std::error_code {};
    if (!std::filesystem::exists(*path, ec))
    {
        auto file = std::ofstream(*path, std::ios::binary);
        if (!file.is_open())
            return std::unexpected(
                TranscriptionFailure::transient(std::format("Cannot write transcript file: {}", path->string())));
        file << PlaceholderText;
    }

    return TranscriptResult { .transcriptPath = path->string(), .language = job.language };
}

} // namespace callscribe
