//----------------------------------------------------------------------------------------------------------------------
// File: NodeIdentifier.hpp
// Description: A node-local unique identifier used to name subscribers on the message broker.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <array>
#include <compare>
#include <cstdint>
#include <optional>
#include <string>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Node {
//----------------------------------------------------------------------------------------------------------------------

class Identifier;

[[nodiscard]] std::optional<Identifier> GenerateIdentifier();

//----------------------------------------------------------------------------------------------------------------------
} // Node namespace
//----------------------------------------------------------------------------------------------------------------------

class Node::Identifier
{
public:
    static constexpr std::size_t Size = 16;
    using Bytes = std::array<std::uint8_t, Size>;

    Identifier();
    explicit Identifier(Bytes const& bytes);

    [[nodiscard]] bool operator==(Identifier const& other) const noexcept;
    [[nodiscard]] std::strong_ordering operator<=>(Identifier const& other) const noexcept;

    [[nodiscard]] Bytes const& GetBytes() const;
    [[nodiscard]] std::string const& ToString() const;
    [[nodiscard]] bool IsValid() const;

private:
    Bytes m_bytes;
    std::string m_representation;
};

//----------------------------------------------------------------------------------------------------------------------
