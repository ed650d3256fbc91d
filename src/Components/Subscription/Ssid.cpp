//----------------------------------------------------------------------------------------------------------------------
// File: Ssid.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Ssid.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <algorithm>
#include <cassert>
#include <ranges>
#include <sstream>
#include <utility>
//----------------------------------------------------------------------------------------------------------------------

Subscription::Ssid::Ssid(std::initializer_list<Segment> segments)
    : m_segments(segments)
{
}

//----------------------------------------------------------------------------------------------------------------------

Subscription::Ssid::Ssid(Segments&& segments)
    : m_segments(std::move(segments))
{
}

//----------------------------------------------------------------------------------------------------------------------

Subscription::Ssid::Segment Subscription::Ssid::operator[](std::size_t index) const
{
    assert(index < m_segments.size());
    return m_segments[index];
}

//----------------------------------------------------------------------------------------------------------------------

std::size_t Subscription::Ssid::GetSize() const { return m_segments.size(); }

//----------------------------------------------------------------------------------------------------------------------

bool Subscription::Ssid::IsEmpty() const { return m_segments.empty(); }

//----------------------------------------------------------------------------------------------------------------------

Subscription::Ssid::Segments const& Subscription::Ssid::GetSegments() const { return m_segments; }

//----------------------------------------------------------------------------------------------------------------------

bool Subscription::Ssid::IsPrefixOf(Ssid const& other) const
{
    if (m_segments.size() > other.m_segments.size()) { return false; }
    return std::ranges::equal(m_segments, other.m_segments | std::views::take(m_segments.size()));
}

//----------------------------------------------------------------------------------------------------------------------

Subscription::Ssid Subscription::Ssid::Append(Segment segment) const
{
    Segments segments{ m_segments };
    segments.emplace_back(segment);
    return Ssid{ std::move(segments) };
}

//----------------------------------------------------------------------------------------------------------------------

std::string Subscription::Ssid::ToString() const
{
    std::ostringstream oss;
    oss << "[";
    for (std::size_t idx = 0; idx < m_segments.size(); ++idx) {
        if (idx != 0) { oss << ", "; }
        oss << m_segments[idx];
    }
    oss << "]";
    return oss.str();
}

//----------------------------------------------------------------------------------------------------------------------
