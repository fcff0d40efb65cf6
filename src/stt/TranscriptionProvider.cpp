// SPDX-License-Identifier: Apache-2.0
#include "TranscriptionProvider.hpp"

#include <format>
#include <fstream>

namespace callscribe
{

auto sanitizeFileStem(std::string_view callId) -> std::string
{
    auto clean = std::string {};
    clean.reserve(callId.size());
    for (auto const c: callId)
    {
        auto const keep = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '-'
                          || c == '_';
        clean += keep ? c : '_';
    }

    auto const first = clean.find_first_not_of("._");
    if (first == std::string::npos)
        return "transcript";
    auto const last = clean.find_last_not_of("._");
    return clean.substr(first, last - first + 1);
}

auto prepareTranscriptPath(std::filesystem::path const& directory, std::string_view callId)
    -> Result<std::filesystem::path>
{
    auto ec = std::error_code {};
    std::filesystem::create_directories(directory, ec);
    if (ec)
        return makeError(ErrorCode::IoError,
                         std::format("Failed to create transcripts directory '{}': {}", directory.string(), ec.message()));
    return directory / std::format("{}.txt", sanitizeFileStem(callId));
}

auto writeTranscript(std::filesystem::path const& directory, std::string_view callId, std::string_view text)
    -> Result<std::filesystem::path>
{
    auto path = prepareTranscriptPath(directory, callId);
    if (!path)
        return path;

    auto const start = text.find_first_not_of(" \t\n\r");
    auto const trimmed =
        start == std::string_view::npos ? std::string_view {} : text.substr(start, text.find_last_not_of(" \t\n\r") - start + 1);

    auto file = std::ofstream(*path, std::ios::trunc | std::ios::binary);
    if (!file.is_open())
        return makeError(ErrorCode::IoError, std::format("Cannot write transcript file: {}", path->string()));
    file << trimmed << '\n';
    if (!file.good())
        return makeError(ErrorCode::IoError, std::format("Failed to write transcript file: {}", path->string()));
    return path;
}

} // namespace callscribe
