// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <queue/MemoryQueueStore.hpp>
#include <records/CallRecord.hpp>
#include <records/CallRecordRepository.hpp>
#include <stt/HttpClient.hpp>
#include <stt/TranscriptionProvider.hpp>

#include <algorithm>
#include <deque>
#include <filesystem>
#include <format>
#include <memory>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

namespace callscribe::test
{

/// @brief A fresh directory under the system temp directory, removed on destruction.
class TempDirectory
{
  public:
    TempDirectory()
    {
        auto device = std::random_device {};
        _path = std::filesystem::temp_directory_path() / std::format("callscribe-test-{:08x}{:08x}", device(), device());
        std::filesystem::create_directories(_path);
    }

    ~TempDirectory()
    {
        auto ec = std::error_code {};
        std::filesystem::remove_all(_path, ec);
    }

    TempDirectory(TempDirectory const&) = delete;
    TempDirectory& operator=(TempDirectory const&) = delete;

    [[nodiscard]] auto path() const -> std::filesystem::path const& { return _path; }

  private:
    std::filesystem::path _path;
};

/// @brief Returns a record in the DOWNLOADED state, as handed over by the download stage.
inline auto downloadedRecord(std::int64_t id, std::string callId, std::string recordingUrl) -> CallRecord
{
    return CallRecord {
        .id = id,
        .callId = std::move(callId),
        .recordingUrl = std::move(recordingUrl),
        .status = CallRecordStatus::Downloaded,
        .retryCount = 0,
        .lastRetryAt = std::nullopt,
        .transcriptPath = std::nullopt,
        .summaryPath = std::nullopt,
        .language = std::nullopt,
        .errorCode = std::nullopt,
        .errorMessage = std::nullopt,
    };
}

/// @brief Provider that replays a fixed list of outcomes and counts its calls.
///
/// Once the script is exhausted the last outcome repeats.
class ScriptedProvider final: public TranscriptionProvider
{
  public:
    explicit ScriptedProvider(std::vector<TranscriptionOutcome> script): _script(std::move(script)) {}

    auto transcribe(JobEnvelope const& job) -> TranscriptionOutcome override
    {
        jobs.push_back(job);
        auto const index = std::min(calls, _script.size() - 1);
        ++calls;
        return _script[index];
    }

    size_t calls = 0;
    std::vector<JobEnvelope> jobs;

  private:
    std::vector<TranscriptionOutcome> _script;
};

/// @brief Provider that throws on every call.
class ThrowingProvider final: public TranscriptionProvider
{
  public:
    auto transcribe(JobEnvelope const& /*job*/) -> TranscriptionOutcome override
    {
        throw std::runtime_error("provider exploded");
    }
};

/// @brief HttpClient that answers from a queue of canned responses and records the requests.
class FakeHttpClient final: public HttpClient
{
  public:
    struct Request
    {
        std::string method;
        std::string url;
        HttpHeaders headers;
        std::string body;
        std::string contentType;
    };

    auto get(std::string const& url, HttpHeaders const& headers) -> Result<HttpResponse> override
    {
        requests.push_back(Request { .method = "GET", .url = url, .headers = headers, .body = {}, .contentType = {} });
        return next();
    }

    auto post(std::string const& url, HttpHeaders const& headers, std::string const& body, std::string const& contentType)
        -> Result<HttpResponse> override
    {
        requests.push_back(
            Request { .method = "POST", .url = url, .headers = headers, .body = body, .contentType = contentType });
        return next();
    }

    std::deque<Result<HttpResponse>> responses;
    std::vector<Request> requests;

  private:
    auto next() -> Result<HttpResponse>
    {
        if (responses.empty())
            return makeError(ErrorCode::IoError, "No canned response left");
        auto response = std::move(responses.front());
        responses.pop_front();
        return response;
    }
};

/// @brief QueueStore over a MemoryQueueStore that fails selected operations on demand.
class FaultyQueueStore final: public QueueStore
{
  public:
    std::optional<std::string> failPushTo; ///< pushBack() to this list fails.
    bool failReplay = false;               ///< replayListValue() fails without changing anything.
    bool loseReplay = false;               ///< replayListValue() acts as if another caller removed the value.

    MemoryQueueStore inner;

    auto pushBack(std::string_view list, std::string_view value) -> Result<std::int64_t> override
    {
        if (failPushTo && *failPushTo == list)
            return makeError(ErrorCode::StoreError, std::format("RPUSH {} refused", list));
        return inner.pushBack(list, value);
    }

    auto popFront(std::string_view list) -> Result<std::optional<std::string>> override { return inner.popFront(list); }

    auto blockingPopFront(std::string_view list, std::chrono::milliseconds timeout)
        -> Result<std::optional<std::string>> override
    {
        return inner.blockingPopFront(list, timeout);
    }

    auto range(std::string_view list, std::int64_t start, std::int64_t stop) -> Result<std::vector<std::string>> override
    {
        return inner.range(list, start, stop);
    }

    auto removeValue(std::string_view list, std::int64_t count, std::string_view value) -> Result<std::int64_t> override
    {
        return inner.removeValue(list, count, value);
    }

    auto length(std::string_view list) -> Result<std::int64_t> override { return inner.length(list); }
    auto addMember(std::string_view set, std::string_view member) -> Result<bool> override
    {
        return inner.addMember(set, member);
    }
    auto removeMember(std::string_view set, std::string_view member) -> Result<bool> override
    {
        return inner.removeMember(set, member);
    }
    auto isMember(std::string_view set, std::string_view member) -> Result<bool> override
    {
        return inner.isMember(set, member);
    }
    auto memberCount(std::string_view set) -> Result<std::int64_t> override { return inner.memberCount(set); }

    auto pushUnlessMember(std::string_view list, std::string_view set, std::string_view member, std::string_view value)
        -> Result<bool> override
    {
        if (failPushTo && *failPushTo == list)
            return makeError(ErrorCode::StoreError, std::format("EVAL push to {} refused", list));
        return inner.pushUnlessMember(list, set, member, value);
    }

    auto replayListValue(std::string_view sourceList,
                         std::string_view value,
                         std::string_view set,
                         std::string_view member,
                         std::string_view targetList,
                         std::string_view replayValue) -> Result<bool> override
    {
        if (failReplay)
            return makeError(ErrorCode::StoreError, "EVAL replay refused");
        if (loseReplay)
            return false;
        return inner.replayListValue(sourceList, value, set, member, targetList, replayValue);
    }
};

} // namespace callscribe::test
