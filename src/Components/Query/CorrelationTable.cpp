//----------------------------------------------------------------------------------------------------------------------
// File: CorrelationTable.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "CorrelationTable.hpp"
#include "Awaiter.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <cassert>
#include <mutex>
#include <numeric>
//----------------------------------------------------------------------------------------------------------------------

Query::CorrelationTable::CorrelationTable()
    : m_shards()
{
}

//----------------------------------------------------------------------------------------------------------------------

Query::CorrelationTable::EmplaceResult Query::CorrelationTable::Emplace(std::shared_ptr<Awaiter> const& spAwaiter)
{
    assert(spAwaiter);
    auto const id = spAwaiter->GetId();
    auto& shard = GetShard(id);

    std::unique_lock lock{ shard.mutex };
    auto const [itr, emplaced] = shard.entries.insert_or_assign(id, Entry{ spAwaiter.get(), spAwaiter });
    return (emplaced) ? EmplaceResult::Inserted : EmplaceResult::Replaced;
}

//----------------------------------------------------------------------------------------------------------------------

std::shared_ptr<Query::Awaiter> Query::CorrelationTable::Find(CorrelationId id) const
{
    auto const& shard = GetShard(id);

    std::shared_lock lock{ shard.mutex };
    if (auto const itr = shard.entries.find(id); itr != shard.entries.end()) { return itr->second.wpAwaiter.lock(); }
    return nullptr;
}

//----------------------------------------------------------------------------------------------------------------------

bool Query::CorrelationTable::Erase(CorrelationId id, Awaiter const* const pAwaiter)
{
    auto& shard = GetShard(id);

    std::unique_lock lock{ shard.mutex };
    auto const itr = shard.entries.find(id);
    if (itr == shard.entries.end() || itr->second.pAwaiter != pAwaiter) { return false; }
    shard.entries.erase(itr);
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

std::size_t Query::CorrelationTable::Size() const
{
    return std::accumulate(m_shards.begin(), m_shards.end(), std::size_t{ 0 }, [] (std::size_t total, auto const& shard) {
        std::shared_lock lock{ shard.mutex };
        return total + shard.entries.size();
    });
}

//----------------------------------------------------------------------------------------------------------------------

Query::CorrelationTable::Shard& Query::CorrelationTable::GetShard(CorrelationId id)
{
    return m_shards[id % ShardCount];
}

//----------------------------------------------------------------------------------------------------------------------

Query::CorrelationTable::Shard const& Query::CorrelationTable::GetShard(CorrelationId id) const
{
    return m_shards[id % ShardCount];
}

//----------------------------------------------------------------------------------------------------------------------
