//----------------------------------------------------------------------------------------------------------------------
// File: ServiceProvider.hpp
// Description: A registry of the node's shared services. Components fetch non-owning references to the collaborators
// they depend upon (e.g. the message broker and cluster service) when they are constructed.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <any>
#include <cassert>
#include <memory>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Node {
//----------------------------------------------------------------------------------------------------------------------

class ServiceProvider;

//----------------------------------------------------------------------------------------------------------------------
} // Node namespace
//----------------------------------------------------------------------------------------------------------------------

class Node::ServiceProvider final
{
public:
    ServiceProvider() = default;

    // Note: Services are keyed on the provided type. An implementation serving multiple interfaces must be registered
    // once for each interface it should be fetched through.
    template<typename Service>
    bool Register(std::shared_ptr<Service> const& spService);

    template<typename Service>
    [[nodiscard]] bool Contains() const;

    template<typename Service>
    [[nodiscard]] std::weak_ptr<Service> Fetch() const;

private:
    std::unordered_map<std::type_index, std::any> m_services;
};

//----------------------------------------------------------------------------------------------------------------------

template<typename Service>
bool Node::ServiceProvider::Register(std::shared_ptr<Service> const& spService)
{
    if (!spService) { return false; }
    auto const [itr, inserted] = m_services.insert_or_assign(typeid(Service), std::weak_ptr<Service>{ spService });
    assert(itr != m_services.end());
    return inserted;
}

//----------------------------------------------------------------------------------------------------------------------

template<typename Service>
bool Node::ServiceProvider::Contains() const { return m_services.contains(typeid(Service)); }

//----------------------------------------------------------------------------------------------------------------------

template<typename Service>
std::weak_ptr<Service> Node::ServiceProvider::Fetch() const
{
    if (auto const itr = m_services.find(typeid(Service)); itr != m_services.end()) {
        return std::any_cast<std::weak_ptr<Service>>(itr->second);
    }

    return std::weak_ptr<Service>{};
}

//----------------------------------------------------------------------------------------------------------------------
