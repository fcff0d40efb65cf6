// SPDX-License-Identifier: Apache-2.0
#include "CallRecordRepository.hpp"

#include <core/JsonUtils.hpp>

#include <format>
#include <fstream>
#include <sstream>
#include <thread>

namespace callscribe
{

// {{{ CallRecordTable
void CallRecordTable::put(CallRecord record)
{
    auto const lock = std::lock_guard { _mutex };
    auto const id = record.id;
    _records.insert_or_assign(id, std::move(record));
}

auto CallRecordTable::get(std::int64_t recordId) const -> std::optional<CallRecord>
{
    auto const lock = std::lock_guard { _mutex };
    auto const it = _records.find(recordId);
    if (it == _records.end())
        return std::nullopt;
    return it->second;
}

auto CallRecordTable::size() const -> size_t
{
    auto const lock = std::lock_guard { _mutex };
    return _records.size();
}
// }}}

// {{{ MemoryCallRecordRepository
MemoryCallRecordRepository::MemoryCallRecordRepository(std::shared_ptr<CallRecordTable> table):
    _table(std::move(table))
{
}

auto MemoryCallRecordRepository::find(std::int64_t recordId) -> Result<std::optional<CallRecord>>
{
    return _table->get(recordId);
}

auto MemoryCallRecordRepository::save(CallRecord const& record) -> VoidResult
{
    _table->put(record);
    return {};
}
// }}}

// {{{ FileCallRecordRepository
FileCallRecordRepository::FileCallRecordRepository(std::filesystem::path directory):
    _directory(std::move(directory))
{
}

auto FileCallRecordRepository::pathFor(std::int64_t recordId) const -> std::filesystem::path
{
    return _directory / std::format("{}.json", recordId);
}

auto FileCallRecordRepository::find(std::int64_t recordId) -> Result<std::optional<CallRecord>>
{
    auto const path = pathFor(recordId);
    auto file = std::ifstream(path);
    if (!file.is_open())
    {
        auto ec = std::error_code {};
        if (!std::filesystem::exists(path, ec))
            return std::optional<CallRecord> {};
        return makeError(ErrorCode::RecordError, std::format("Cannot open call record file: {}", path.string()));
    }

    auto ss = std::stringstream {};
    ss << file.rdbuf();

    auto value = json::parseObject(ss.str());
    if (!value)
        return makeError(ErrorCode::RecordError,
                         std::format("Corrupt call record file {}: {}", path.string(), value.error().message));

    return callRecordFromJson(*value).transform([](CallRecord record) { return std::optional { std::move(record) }; });
}

auto FileCallRecordRepository::save(CallRecord const& record) -> VoidResult
{
    auto ec = std::error_code {};
    std::filesystem::create_directories(_directory, ec);
    if (ec)
        return makeError(ErrorCode::RecordError,
                         std::format("Failed to create records directory '{}': {}", _directory.string(), ec.message()));

    auto const target = pathFor(record.id);
    auto temporary = target;
    temporary += std::format(".tmp-{}", std::hash<std::thread::id> {}(std::this_thread::get_id()));

    {
        auto file = std::ofstream(temporary, std::ios::trunc);
        if (!file.is_open())
            return makeError(ErrorCode::RecordError,
                             std::format("Cannot write call record file: {}", temporary.string()));
        file << json::serialize(toJson(record), 4) << '\n';
        if (!file.good())
            return makeError(ErrorCode::RecordError,
                             std::format("Failed to write call record file: {}", temporary.string()));
    }

    std::filesystem::rename(temporary, target, ec);
    if (ec)
    {
        auto const reason = ec.message();
        std::filesystem::remove(temporary, ec);
        return makeError(ErrorCode::RecordError,
                         std::format("Failed to replace call record file {}: {}", target.string(), reason));
    }
    return {};
}
// }}}

} // namespace callscribe
