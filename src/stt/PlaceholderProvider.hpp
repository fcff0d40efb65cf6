// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <stt/TranscriptionProvider.hpp>

namespace callscribe
{

/// @brief The "stub" engine: writes a placeholder transcript instead of recognizing speech.
///
/// An existing transcript file is left untouched. The reported language is the job's hint.
class PlaceholderProvider final: public TranscriptionProvider
{
  public:
    static constexpr auto PlaceholderText =
        std::string_view { "Transcription placeholder. Configure a real STT provider to replace this output.\n" };

    explicit PlaceholderProvider(std::filesystem::path transcriptsDir);

    [[nodiscard]] auto transcribe(JobEnvelope const& job) -> TranscriptionOutcome override;

  private:
    std::filesystem::path _transcriptsDir;
};

} // namespace callscribe
