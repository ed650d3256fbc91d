//----------------------------------------------------------------------------------------------------------------------
// File: Awaiter.hpp
// Description: Represents one outstanding cluster query. Responses are delivered by the manager's dispatch threads
// and collected by the requesting thread through Gather(), which blocks until the expected number of responses has
// arrived or the timeout elapses.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Definitions.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
//----------------------------------------------------------------------------------------------------------------------

namespace spdlog { class logger; }

//----------------------------------------------------------------------------------------------------------------------
namespace Query {
//----------------------------------------------------------------------------------------------------------------------

class Awaiter;
class CorrelationTable;

//----------------------------------------------------------------------------------------------------------------------
} // Query namespace
//----------------------------------------------------------------------------------------------------------------------

class Query::Awaiter final
{
public:
    enum class DeliveryResult : std::uint32_t { Accepted, Completed, Overflow };

    Awaiter(CorrelationId id, std::size_t maximum, std::weak_ptr<CorrelationTable> const& wpTable);
    ~Awaiter();

    Awaiter(Awaiter const&) = delete;
    Awaiter(Awaiter&& ) = delete;
    Awaiter& operator=(Awaiter const&) = delete;
    Awaiter& operator=(Awaiter&&) = delete;

    [[nodiscard]] CorrelationId GetId() const;
    [[nodiscard]] std::size_t GetMaximum() const;
    [[nodiscard]] std::size_t GetReceived() const;
    [[nodiscard]] bool IsCompleted() const;

    // Never blocks. Responses arriving after the gather has completed, or beyond the expected maximum, are rejected.
    [[nodiscard]] DeliveryResult Deliver(Message::Buffer const& payload);

    // Blocks until the expected number of responses have been received or the timeout elapses, whichever is first.
    // The awaiter is withdrawn from the correlation table on every exit path. Subsequent calls return immediately
    // without any responses.
    [[nodiscard]] Responses Gather(std::chrono::milliseconds timeout);

private:
    void Release();

    CorrelationId const m_id;
    std::size_t const m_maximum;
    std::weak_ptr<CorrelationTable> const m_wpTable;

    mutable std::mutex m_mutex;
    std::condition_variable m_condition;
    Responses m_responses;
    std::size_t m_received;
    bool m_completed;

    std::atomic_bool m_released;
    std::shared_ptr<spdlog::logger> m_logger;
};

//----------------------------------------------------------------------------------------------------------------------
