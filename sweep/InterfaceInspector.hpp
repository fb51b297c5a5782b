#pragma once

#include <optional>
#include <string>
#include <utility>

namespace lan_sweep::sweep
{
    struct InterfaceAddress
    {
        std::string name;
        std::string address;
        std::string netmask;
    };

    class InterfaceInspector
    {
    public:
        virtual ~InterfaceInspector() = default;

        // nullopt when the local network configuration cannot be determined.
        virtual std::optional<InterfaceAddress> Inspect() = 0;
    };

    // Returns values given up front, e.g. from the command line.
    class FixedInterfaceInspector : public InterfaceInspector
    {
    public:
        explicit FixedInterfaceInspector(std::optional<InterfaceAddress> value) : m_value(std::move(value)) {}

        std::optional<InterfaceAddress> Inspect() override { return m_value; }

    private:
        std::optional<InterfaceAddress> m_value;
    };
}
