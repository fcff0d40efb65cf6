// SPDX-License-Identifier: Apache-2.0
#include "CallSummarizer.hpp"

#include <core/Log.hpp>
#include <stt/TranscriptionProvider.hpp>

#include <algorithm>
#include <format>
#include <fstream>
#include <sstream>

namespace callscribe
{

namespace
{

    constexpr auto MinBullets = size_t { 3 };
    constexpr auto MaxBullets = size_t { 5 };
    constexpr auto MaxBulletLength = size_t { 256 }; // in code points
    constexpr auto Ellipsis = std::string_view { "\xe2\x80\xa6" };

    auto isSpace(char c) noexcept -> bool
    {
        return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
    }

    auto isSentenceEnd(char c) noexcept -> bool
    {
        return c == '.' || c == '!' || c == '?';
    }

    auto splitWords(std::string_view text) -> std::vector<std::string_view>
    {
        auto words = std::vector<std::string_view> {};
        auto pos = size_t { 0 };
        while (pos < text.size())
        {
            while (pos < text.size() && isSpace(text[pos]))
                ++pos;
            auto const start = pos;
            while (pos < text.size() && !isSpace(text[pos]))
                ++pos;
            if (pos > start)
                words.push_back(text.substr(start, pos - start));
        }
        return words;
    }

    auto joinWords(std::vector<std::string_view> const& words, size_t first, size_t last) -> std::string
    {
        auto out = std::string {};
        for (auto i = first; i < last; ++i)
        {
            if (!out.empty())
                out += ' ';
            out += words[i];
        }
        return out;
    }

    auto normalizeSpaces(std::string_view text) -> std::string
    {
        auto const words = splitWords(text);
        return joinWords(words, 0, words.size());
    }

    /// Sentences in reading order: per line, split after sentence punctuation followed by whitespace.
    auto extractSentences(std::string_view text) -> std::vector<std::string>
    {
        auto sentences = std::vector<std::string> {};
        auto emit = [&](std::string_view piece) {
            if (auto sentence = normalizeSpaces(piece); !sentence.empty())
                sentences.push_back(std::move(sentence));
        };

        auto lineStart = size_t { 0 };
        while (lineStart < text.size())
        {
            auto lineEnd = text.find('\n', lineStart);
            if (lineEnd == std::string_view::npos)
                lineEnd = text.size();
            auto const line = text.substr(lineStart, lineEnd - lineStart);

            auto sentenceStart = size_t { 0 };
            for (auto i = size_t { 0 }; i + 1 < line.size(); ++i)
            {
                if (isSentenceEnd(line[i]) && isSpace(line[i + 1]))
                {
                    emit(line.substr(sentenceStart, i + 1 - sentenceStart));
                    sentenceStart = i + 1;
                }
            }
            emit(line.substr(sentenceStart));
            lineStart = lineEnd + 1;
        }
        return sentences;
    }

    auto truncateBullet(std::string text) -> std::string
    {
        auto codePoints = size_t { 0 };
        auto cut = text.size();
        for (auto i = size_t { 0 }; i < text.size(); ++i)
        {
            if ((static_cast<unsigned char>(text[i]) & 0xC0) == 0x80)
                continue;
            if (codePoints == MaxBulletLength - 1)
                cut = i;
            ++codePoints;
        }
        if (codePoints <= MaxBulletLength)
            return text;

        text.resize(cut);
        while (!text.empty() && isSpace(text.back()))
            text.pop_back();
        text += Ellipsis;
        return text;
    }

    /// Splits the words of @p text into @p target chunks of about equal size.
    auto fallbackChunks(std::string_view text, size_t target) -> std::vector<std::string>
    {
        auto const words = splitWords(text);
        if (words.empty())
            return {};

        auto const chunkSize = std::max<size_t>(1, (words.size() + target - 1) / target);
        auto chunks = std::vector<std::string> {};
        for (auto index = size_t { 0 }; index < target; ++index)
        {
            auto const start = index * chunkSize;
            if (start >= words.size())
                continue;
            auto const end = index + 1 < target ? std::min(start + chunkSize, words.size()) : words.size();
            chunks.push_back(joinWords(words, start, end));
        }
        return chunks;
    }

    auto readTextFile(std::filesystem::path const& path) -> Result<std::string>
    {
        auto file = std::ifstream(path, std::ios::binary);
        if (!file.is_open())
            return makeError(ErrorCode::IoError, std::format("Cannot read transcript file: {}", path.string()));
        auto contents = std::stringstream {};
        contents << file.rdbuf();
        return contents.str();
    }

} // namespace

auto buildSummaryBullets(std::string_view transcript) -> Result<std::vector<std::string>>
{
    if (splitWords(transcript).empty())
        return makeError(ErrorCode::InvalidArgument, "Transcript text is empty; cannot generate summary");

    auto bullets = std::vector<std::string> {};
    for (auto& sentence: extractSentences(transcript))
    {
        bullets.push_back(truncateBullet(std::move(sentence)));
        if (bullets.size() >= MaxBullets)
            break;
    }
    if (bullets.size() >= MinBullets)
        return bullets;

    log::debug("Transcript has only {} sentence(s), summarizing word chunks instead", bullets.size());
    for (auto& chunk: fallbackChunks(transcript, MinBullets))
        bullets.push_back(truncateBullet(std::move(chunk)));

    auto unique = std::vector<std::string> {};
    for (auto& bullet: bullets)
        if (std::ranges::find(unique, bullet) == unique.end())
            unique.push_back(std::move(bullet));

    if (unique.size() < MinBullets)
        return makeError(ErrorCode::InvalidArgument, "Transcript is too short to generate a summary");
    if (unique.size() > MaxBullets)
        unique.resize(MaxBullets);
    return unique;
}

auto formatSummaryMarkdown(std::vector<std::string> const& bullets) -> std::string
{
    auto markdown = std::string {};
    for (auto const& bullet: bullets)
        markdown += std::format("- {}\n", bullet);
    return markdown;
}

auto summaryPathFor(std::filesystem::path const& directory, std::string_view callId, Timestamp createdAt)
    -> std::filesystem::path
{
    auto const moment = std::chrono::floor<std::chrono::seconds>(createdAt);
    return directory / std::format("{:%Y}", moment) / std::format("{:%m}", moment) / std::format("{:%d}", moment)
           / std::format("call_{}_{:%Y%m%dT%H%M%S}Z.md", sanitizeFileStem(callId), moment);
}

CallSummarizer::CallSummarizer(std::filesystem::path directory, Clock clock):
    _directory(std::move(directory)), _clock(clock ? std::move(clock) : Clock { nowUtc })
{
}

auto CallSummarizer::summarize(std::string_view callId, std::string_view transcript) const -> Result<CallSummary>
{
    auto bullets = buildSummaryBullets(transcript);
    if (!bullets)
        return std::unexpected(bullets.error());

    auto const path = summaryPathFor(_directory, callId, _clock());

    auto ec = std::error_code {};
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec)
        return makeError(ErrorCode::IoError,
                         std::format("Failed to create summaries directory '{}': {}", path.parent_path().string(), ec.message()));

    auto file = std::ofstream(path, std::ios::trunc | std::ios::binary);
    if (!file.is_open())
        return makeError(ErrorCode::IoError, std::format("Cannot write summary file: {}", path.string()));
    file << formatSummaryMarkdown(*bullets);
    if (!file.good())
        return makeError(ErrorCode::IoError, std::format("Failed to write summary file: {}", path.string()));

    return CallSummary { .path = path.string(), .bullets = std::move(*bullets) };
}

auto CallSummarizer::summarizeFile(std::string_view callId, std::string_view transcriptPath) const
    -> Result<CallSummary>
{
    auto location = transcriptPath;
    if (location.starts_with("file://"))
        location.remove_prefix(7);
    else if (location.find("://") != std::string_view::npos)
        return makeError(ErrorCode::InvalidArgument,
                         std::format("Cannot summarize transcript stored at '{}'", transcriptPath));

    auto text = readTextFile(std::filesystem::path(location));
    if (!text)
        return std::unexpected(text.error());
    return summarize(callId, *text);
}

} // namespace callscribe
