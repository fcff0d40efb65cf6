// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <records/CallRecord.hpp>

#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>

namespace callscribe
{

/// @brief Read/update access to call records owned by another system.
///
/// The pipeline never creates or deletes records. A repository instance is a unit of
/// work: the worker opens one per job and drops it when the job is finished.
class CallRecordRepository
{
  public:
    virtual ~CallRecordRepository() = default;

    /// @brief Looks up a record. A missing record is not an error.
    [[nodiscard]] virtual auto find(std::int64_t recordId) -> Result<std::optional<CallRecord>> = 0;

    /// @brief Persists all fields of @p record.
    [[nodiscard]] virtual auto save(CallRecord const& record) -> VoidResult = 0;
};

/// @brief Opens a fresh repository session.
using CallRecordRepositoryFactory = std::function<std::unique_ptr<CallRecordRepository>()>;

/// @brief Thread-safe in-memory record table shared by MemoryCallRecordRepository sessions.
class CallRecordTable
{
  public:
    void put(CallRecord record);
    [[nodiscard]] auto get(std::int64_t recordId) const -> std::optional<CallRecord>;
    [[nodiscard]] auto size() const -> size_t;

  private:
    mutable std::mutex _mutex;
    std::map<std::int64_t, CallRecord> _records;
};

class MemoryCallRecordRepository final: public CallRecordRepository
{
  public:
    explicit MemoryCallRecordRepository(std::shared_ptr<CallRecordTable> table);

    [[nodiscard]] auto find(std::int64_t recordId) -> Result<std::optional<CallRecord>> override;
    [[nodiscard]] auto save(CallRecord const& record) -> VoidResult override;

  private:
    std::shared_ptr<CallRecordTable> _table;
};

/// @brief Stores each record as "<directory>/<id>.json".
///
/// Writes go to a temporary file that is renamed over the target, so readers never
/// observe a partially written record.
class FileCallRecordRepository final: public CallRecordRepository
{
  public:
    explicit FileCallRecordRepository(std::filesystem::path directory);

    [[nodiscard]] auto find(std::int64_t recordId) -> Result<std::optional<CallRecord>> override;
    [[nodiscard]] auto save(CallRecord const& record) -> VoidResult override;

    [[nodiscard]] auto pathFor(std::int64_t recordId) const -> std::filesystem::path;

  private:
    std::filesystem::path _directory;
};

} // namespace callscribe
