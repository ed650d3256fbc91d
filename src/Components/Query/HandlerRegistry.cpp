//----------------------------------------------------------------------------------------------------------------------
// File: HandlerRegistry.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "HandlerRegistry.hpp"
#include "Utilities/Logger.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <cassert>
#include <exception>
//----------------------------------------------------------------------------------------------------------------------

Query::HandlerRegistry::HandlerRegistry()
    : m_handlers()
    , m_logger(Logger::Get(Logger::Name::Query))
{
    assert(m_logger);
}

//----------------------------------------------------------------------------------------------------------------------

void Query::HandlerRegistry::Append(Handler const& handler)
{
    assert(handler);
    m_handlers.emplace_back(handler);
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Message::Buffer> Query::HandlerRegistry::Handle(
    std::string_view type, Message::Buffer const& request) const
{
    constexpr std::string_view ExceptionError =
        "Query handler {} encountered an exception handling a \"{}\" query: \"{}\"";

    for (std::size_t idx = 0; idx < m_handlers.size(); ++idx) {
        try {
            if (auto optResponse = m_handlers[idx](type, request); optResponse) { return optResponse; }
        } catch (std::exception const& e) {
            // A handler that fails is treated as if it had declined the query.
            m_logger->error(ExceptionError, idx, type, e.what());
        }
    }

    return {};
}

//----------------------------------------------------------------------------------------------------------------------

std::size_t Query::HandlerRegistry::Size() const { return m_handlers.size(); }

//----------------------------------------------------------------------------------------------------------------------

bool Query::HandlerRegistry::IsEmpty() const { return m_handlers.empty(); }

//----------------------------------------------------------------------------------------------------------------------
