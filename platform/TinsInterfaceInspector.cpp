#include "TinsInterfaceInspector.hpp"

#include <tins/tins.h>
#include <iostream>

namespace lan_sweep::platform
{
    TinsInterfaceInspector::TinsInterfaceInspector(std::string interfaceName)
        : m_interfaceName(std::move(interfaceName))
    {
    }

    std::optional<sweep::InterfaceAddress> TinsInterfaceInspector::Inspect()
    {
        try
        {
            Tins::NetworkInterface iface = m_interfaceName.empty()
                                               ? Tins::NetworkInterface::default_interface()
                                               : Tins::NetworkInterface(m_interfaceName);
            Tins::NetworkInterface::Info info = iface.info();

            if (info.ip_addr == Tins::IPv4Address())
            {
                std::cerr << "[InterfaceInspector] Interface " << iface.name() << " has no IPv4 address\n";
                return std::nullopt;
            }

            sweep::InterfaceAddress result;
            result.name = iface.name();
            result.address = info.ip_addr.to_string();
            result.netmask = info.netmask.to_string();
            return result;
        }
        catch (const std::exception &e)
        {
            std::cerr << "[InterfaceInspector] Failed to inspect interface: " << e.what() << "\n";
            return std::nullopt;
        }
    }
}
