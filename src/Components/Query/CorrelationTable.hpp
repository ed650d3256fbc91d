//----------------------------------------------------------------------------------------------------------------------
// File: CorrelationTable.hpp
// Description: Maps the correlation identifiers of outstanding queries to their awaiters. The table is split into
// independently locked shards such that concurrent requests and responses for different queries do not contend on a
// single lock.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Definitions.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <array>
#include <cstdint>
#include <memory>
#include <shared_mutex>
#include <unordered_map>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Query {
//----------------------------------------------------------------------------------------------------------------------

class Awaiter;
class CorrelationTable;

//----------------------------------------------------------------------------------------------------------------------
} // Query namespace
//----------------------------------------------------------------------------------------------------------------------

class Query::CorrelationTable
{
public:
    static constexpr std::size_t ShardCount = 16;

    enum class EmplaceResult : std::uint32_t { Inserted, Replaced };

    CorrelationTable();

    CorrelationTable(CorrelationTable const&) = delete;
    CorrelationTable(CorrelationTable&& ) = delete;
    CorrelationTable& operator=(CorrelationTable const&) = delete;
    CorrelationTable& operator=(CorrelationTable&&) = delete;

    // Note: The table does not own the awaiters. An entry whose awaiter has been destroyed is never returned.
    EmplaceResult Emplace(std::shared_ptr<Awaiter> const& spAwaiter);
    [[nodiscard]] std::shared_ptr<Awaiter> Find(CorrelationId id) const;

    // Removes the entry for the identifier only when it still refers to the provided awaiter. A wrapped identifier
    // that has been claimed by a newer awaiter is left in place.
    bool Erase(CorrelationId id, Awaiter const* const pAwaiter);

    [[nodiscard]] std::size_t Size() const;

private:
    struct Entry
    {
        Awaiter const* pAwaiter;
        std::weak_ptr<Awaiter> wpAwaiter;
    };

    struct Shard
    {
        mutable std::shared_mutex mutex;
        std::unordered_map<CorrelationId, Entry> entries;
    };

    [[nodiscard]] Shard& GetShard(CorrelationId id);
    [[nodiscard]] Shard const& GetShard(CorrelationId id) const;

    std::array<Shard, ShardCount> m_shards;
};

//----------------------------------------------------------------------------------------------------------------------
