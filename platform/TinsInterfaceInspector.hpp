#pragma once

#include <string>
#include "../sweep/InterfaceInspector.hpp"

namespace lan_sweep::platform
{
    // Reads the IPv4 address and netmask of an interface through libtins.
    // An empty name selects the interface holding the default route.
    class TinsInterfaceInspector : public sweep::InterfaceInspector
    {
    public:
        explicit TinsInterfaceInspector(std::string interfaceName = "");

        std::optional<sweep::InterfaceAddress> Inspect() override;

    private:
        std::string m_interfaceName;
    };
}
