//----------------------------------------------------------------------------------------------------------------------
// File: NodeIdentifier.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "NodeIdentifier.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/algorithm/hex.hpp>
#include <openssl/err.h>
#include <openssl/rand.h>
//----------------------------------------------------------------------------------------------------------------------
#include <algorithm>
#include <iterator>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

[[nodiscard]] std::string Encode(Node::Identifier::Bytes const& bytes);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

std::optional<Node::Identifier> Node::GenerateIdentifier()
{
    Identifier::Bytes bytes{ 0 };
    if (RAND_bytes(bytes.data(), static_cast<std::int32_t>(bytes.size())) != 1) {
        ERR_clear_error();
        return {};
    }

    return Identifier{ bytes };
}

//----------------------------------------------------------------------------------------------------------------------

Node::Identifier::Identifier()
    : m_bytes{ 0 }
    , m_representation()
{
}

//----------------------------------------------------------------------------------------------------------------------

Node::Identifier::Identifier(Bytes const& bytes)
    : m_bytes(bytes)
    , m_representation(local::Encode(bytes))
{
}

//----------------------------------------------------------------------------------------------------------------------

bool Node::Identifier::operator==(Identifier const& other) const noexcept { return m_bytes == other.m_bytes; }

//----------------------------------------------------------------------------------------------------------------------

std::strong_ordering Node::Identifier::operator<=>(Identifier const& other) const noexcept
{
    return m_bytes <=> other.m_bytes;
}

//----------------------------------------------------------------------------------------------------------------------

Node::Identifier::Bytes const& Node::Identifier::GetBytes() const { return m_bytes; }

//----------------------------------------------------------------------------------------------------------------------

std::string const& Node::Identifier::ToString() const { return m_representation; }

//----------------------------------------------------------------------------------------------------------------------

bool Node::Identifier::IsValid() const
{
    return std::ranges::any_of(m_bytes, [] (std::uint8_t byte) { return byte != 0; });
}

//----------------------------------------------------------------------------------------------------------------------

std::string local::Encode(Node::Identifier::Bytes const& bytes)
{
    std::string encoded;
    encoded.reserve(bytes.size() * 2);
    boost::algorithm::hex_lower(bytes.begin(), bytes.end(), std::back_inserter(encoded));
    return encoded;
}

//----------------------------------------------------------------------------------------------------------------------
