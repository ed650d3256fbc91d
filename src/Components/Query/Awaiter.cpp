//----------------------------------------------------------------------------------------------------------------------
// File: Awaiter.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Awaiter.hpp"
#include "CorrelationTable.hpp"
#include "Utilities/Logger.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <cassert>
//----------------------------------------------------------------------------------------------------------------------

Query::Awaiter::Awaiter(CorrelationId id, std::size_t maximum, std::weak_ptr<CorrelationTable> const& wpTable)
    : m_id(id)
    , m_maximum(maximum)
    , m_wpTable(wpTable)
    , m_mutex()
    , m_condition()
    , m_responses()
    , m_received(0)
    , m_completed(false)
    , m_released(false)
    , m_logger(Logger::Get(Logger::Name::Query))
{
    assert(m_logger);
    m_responses.reserve(m_maximum);
}

//----------------------------------------------------------------------------------------------------------------------

Query::Awaiter::~Awaiter()
{
    Release(); // An awaiter dropped without being gathered must still be withdrawn from the table.
}

//----------------------------------------------------------------------------------------------------------------------

Query::CorrelationId Query::Awaiter::GetId() const { return m_id; }

//----------------------------------------------------------------------------------------------------------------------

std::size_t Query::Awaiter::GetMaximum() const { return m_maximum; }

//----------------------------------------------------------------------------------------------------------------------

std::size_t Query::Awaiter::GetReceived() const
{
    std::scoped_lock lock{ m_mutex };
    return m_received;
}

//----------------------------------------------------------------------------------------------------------------------

bool Query::Awaiter::IsCompleted() const
{
    std::scoped_lock lock{ m_mutex };
    return m_completed;
}

//----------------------------------------------------------------------------------------------------------------------

Query::Awaiter::DeliveryResult Query::Awaiter::Deliver(Message::Buffer const& payload)
{
    bool fulfilled = false;
    {
        std::scoped_lock lock{ m_mutex };
        if (m_completed) { return DeliveryResult::Completed; }
        if (m_received >= m_maximum) { return DeliveryResult::Overflow; }

        m_responses.emplace_back(payload);
        fulfilled = (++m_received == m_maximum);
    }

    if (fulfilled) { m_condition.notify_all(); }
    return DeliveryResult::Accepted;
}

//----------------------------------------------------------------------------------------------------------------------

Query::Responses Query::Awaiter::Gather(std::chrono::milliseconds timeout)
{
    constexpr std::string_view GatheredMessage = "Gathered {} of {} responses for query. [id={}]";
    constexpr std::string_view PartialMessage = "Query timed out after {}ms with {} of {} responses. [id={}]";
    constexpr std::string_view CompletedWarning = "Ignoring gather for a query that has already completed. [id={}]";

    Responses responses;
    bool fulfilled = false;
    {
        std::unique_lock lock{ m_mutex };
        if (m_completed) {
            lock.unlock();
            m_logger->warn(CompletedWarning, m_id);
            Release();
            return responses;
        }

        // When no responses are expected, the query is immediately fulfilled.
        fulfilled = m_received >= m_maximum;
        if (!fulfilled) {
            auto const deadline = std::chrono::steady_clock::now() + timeout;
            fulfilled = m_condition.wait_until(lock, deadline, [this] { return m_received >= m_maximum; });
        }

        m_completed = true; // Any responses delivered after this point will be rejected.
        responses = std::move(m_responses);
    }

    // The table entry must be withdrawn without holding the awaiter's lock.
    Release();

    if (fulfilled) {
        m_logger->debug(GatheredMessage, responses.size(), m_maximum, m_id);
    } else {
        m_logger->debug(PartialMessage, timeout.count(), responses.size(), m_maximum, m_id);
    }

    return responses;
}

//----------------------------------------------------------------------------------------------------------------------

void Query::Awaiter::Release()
{
    if (m_released.exchange(true)) { return; }
    if (auto const spTable = m_wpTable.lock(); spTable) {
        [[maybe_unused]] bool const erased = spTable->Erase(m_id, this);
    }
}

//----------------------------------------------------------------------------------------------------------------------
