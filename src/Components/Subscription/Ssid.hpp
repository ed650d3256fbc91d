//----------------------------------------------------------------------------------------------------------------------
// File: Ssid.hpp
// Description: Subscription identifiers used to address traffic on the message broker. An identifier is an ordered
// tuple of numeric segments, the leading segments select the channel and trailing segments narrow it.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <compare>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Subscription {
//----------------------------------------------------------------------------------------------------------------------

class Ssid;

enum class SubscriberType : std::uint32_t { Direct, Wildcard };

//----------------------------------------------------------------------------------------------------------------------
namespace Reserved {
//----------------------------------------------------------------------------------------------------------------------

// Note: Every node in the cluster must agree on these values. They are never exposed to user addressable channels.
constexpr std::uint32_t System = 0;
constexpr std::uint32_t Query = 3'939'663'052;

//----------------------------------------------------------------------------------------------------------------------
} // Reserved namespace
//----------------------------------------------------------------------------------------------------------------------
} // Subscription namespace
//----------------------------------------------------------------------------------------------------------------------

class Subscription::Ssid
{
public:
    using Segment = std::uint32_t;
    using Segments = std::vector<Segment>;

    Ssid() = default;
    Ssid(std::initializer_list<Segment> segments);
    explicit Ssid(Segments&& segments);

    [[nodiscard]] bool operator==(Ssid const& other) const = default;
    [[nodiscard]] std::strong_ordering operator<=>(Ssid const& other) const = default;

    [[nodiscard]] Segment operator[](std::size_t index) const;
    [[nodiscard]] std::size_t GetSize() const;
    [[nodiscard]] bool IsEmpty() const;
    [[nodiscard]] Segments const& GetSegments() const;

    [[nodiscard]] bool IsPrefixOf(Ssid const& other) const;
    [[nodiscard]] Ssid Append(Segment segment) const;

    [[nodiscard]] std::string ToString() const;

private:
    Segments m_segments;
};

//----------------------------------------------------------------------------------------------------------------------
