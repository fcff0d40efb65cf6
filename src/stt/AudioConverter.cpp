// SPDX-License-Identifier: Apache-2.0
#include "AudioConverter.hpp"

#include <miniaudio.h>

#include <algorithm>
#include <array>
#include <cstring>
#include <format>

namespace callscribe
{

namespace
{

    /// @brief Growable in-memory sink for ma_encoder.
    struct MemorySink
    {
        std::string data;
        size_t position = 0;
    };

    auto sinkWrite(ma_encoder* encoder, void const* buffer, size_t bytesToWrite, size_t* bytesWritten) -> ma_result
    {
        auto* sink = static_cast<MemorySink*>(encoder->pUserData);
        if (sink->position + bytesToWrite > sink->data.size())
            sink->data.resize(sink->position + bytesToWrite);
        std::memcpy(sink->data.data() + sink->position, buffer, bytesToWrite);
        sink->position += bytesToWrite;
        *bytesWritten = bytesToWrite;
        return MA_SUCCESS;
    }

    auto sinkSeek(ma_encoder* encoder, ma_int64 offset, ma_seek_origin origin) -> ma_result
    {
        auto* sink = static_cast<MemorySink*>(encoder->pUserData);
        auto base = ma_int64 { 0 };
        if (origin == ma_seek_origin_current)
            base = static_cast<ma_int64>(sink->position);
        else if (origin == ma_seek_origin_end)
            base = static_cast<ma_int64>(sink->data.size());

        auto const target = base + offset;
        if (target < 0)
            return MA_INVALID_ARGS;
        sink->position = static_cast<size_t>(target);
        if (sink->position > sink->data.size())
            sink->data.resize(sink->position);
        return MA_SUCCESS;
    }

} // namespace

auto decodeToMono16k(std::string_view encoded) -> Result<std::vector<float>>
{
    if (encoded.empty())
        return makeError(ErrorCode::AudioError, "Recording is empty");

    auto config = ma_decoder_config_init(ma_format_f32, 1, TranscriptionSampleRate);
    auto decoder = ma_decoder {};
    auto const initResult = ma_decoder_init_memory(encoded.data(), encoded.size(), &config, &decoder);
    if (initResult != MA_SUCCESS)
        return makeError(ErrorCode::AudioError,
                         std::format("Unsupported or corrupt audio data: {}", ma_result_description(initResult)));

    auto samples = std::vector<float> {};
    auto chunk = std::array<float, 4096> {};
    while (true)
    {
        auto framesRead = ma_uint64 { 0 };
        auto const readResult = ma_decoder_read_pcm_frames(&decoder, chunk.data(), chunk.size(), &framesRead);
        samples.insert(samples.end(), chunk.begin(), chunk.begin() + static_cast<std::ptrdiff_t>(framesRead));
        if (readResult == MA_AT_END || framesRead == 0)
            break;
        if (readResult != MA_SUCCESS)
        {
            ma_decoder_uninit(&decoder);
            return makeError(ErrorCode::AudioError,
                             std::format("Failed to decode audio: {}", ma_result_description(readResult)));
        }
    }

    ma_decoder_uninit(&decoder);
    return samples;
}

auto encodeWav16k(std::span<float const> samples) -> Result<std::string>
{
    auto pcm = std::vector<ma_int16>(samples.size());
    for (auto i = size_t { 0 }; i < samples.size(); ++i)
        pcm[i] = static_cast<ma_int16>(std::clamp(samples[i], -1.0f, 1.0f) * 32767.0f);

    auto sink = MemorySink {};
    auto config = ma_encoder_config_init(ma_encoding_format_wav, ma_format_s16, 1, TranscriptionSampleRate);
    auto encoder = ma_encoder {};
    auto const initResult = ma_encoder_init(sinkWrite, sinkSeek, &sink, &config, &encoder);
    if (initResult != MA_SUCCESS)
        return makeError(ErrorCode::AudioError,
                         std::format("Failed to initialize WAV encoder: {}", ma_result_description(initResult)));

    auto framesWritten = ma_uint64 { 0 };
    auto const writeResult = ma_encoder_write_pcm_frames(&encoder, pcm.data(), pcm.size(), &framesWritten);
    ma_encoder_uninit(&encoder);

    if (writeResult != MA_SUCCESS || framesWritten != pcm.size())
        return makeError(ErrorCode::AudioError,
                         std::format("Failed to encode WAV: {}", ma_result_description(writeResult)));

    return std::move(sink.data);
}

} // namespace callscribe
