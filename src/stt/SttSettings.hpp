// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <string>

namespace callscribe
{

/// @brief OpenAI-compatible transcription API ("openai-whisper" engine).
struct OpenAiSettings
{
    bool enabled = false;
    std::string apiKey;
    std::string baseUrl = "https://api.openai.com/v1";
    std::string model = "whisper-1";
};

/// @brief Self-hosted HTTP transcription backend ("local" engine).
struct LocalSttSettings
{
    bool enabled = false;
    std::string url;
    std::string apiKey;
};

/// @brief In-process whisper.cpp ("whisper" engine).
struct WhisperSettings
{
    bool enabled = false;
    std::string modelPath;
    int threads = 4;
};

/// @brief Markdown call summaries written after a successful transcription.
struct SummarySettings
{
    bool enabled = false;
    std::string directory = "./storage/summaries";
};

/// @brief Speech-to-text configuration section.
struct SttSettings
{
    std::string defaultEngine = "stub";
    std::string defaultLanguage;
    std::string transcriptsDir = "./storage/transcripts";
    int requestTimeoutSeconds = 30;
    int maxFileMinutes = 0; ///< 0 disables the duration limit.
    int maxFileSizeMb = 0;  ///< 0 disables the size limit.
    OpenAiSettings openai;
    LocalSttSettings local;
    WhisperSettings whisper;
    SummarySettings summary;
    std::string errorHint413;
    std::string errorHint422;
};

} // namespace callscribe
