//----------------------------------------------------------------------------------------------------------------------
// File: HandlerRegistry.hpp
// Description: An ordered list of query handlers. Handlers are offered a query in the order they were registered and
// the first handler to claim it produces the response.
// Notes: Registration is not synchronized with dispatch. All handlers must be registered before the owning manager
// begins receiving traffic.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Definitions.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

namespace spdlog { class logger; }

//----------------------------------------------------------------------------------------------------------------------
namespace Query {
//----------------------------------------------------------------------------------------------------------------------

class HandlerRegistry;

//----------------------------------------------------------------------------------------------------------------------
} // Query namespace
//----------------------------------------------------------------------------------------------------------------------

class Query::HandlerRegistry
{
public:
    HandlerRegistry();

    void Append(Handler const& handler);

    [[nodiscard]] std::optional<Message::Buffer> Handle(std::string_view type, Message::Buffer const& request) const;

    [[nodiscard]] std::size_t Size() const;
    [[nodiscard]] bool IsEmpty() const;

private:
    std::vector<Handler> m_handlers;
    std::shared_ptr<spdlog::logger> m_logger;
};

//----------------------------------------------------------------------------------------------------------------------
