#pragma once

#include <atomic>
#include <cstdint>
#include <string>
#include "../sweep/Prober.hpp"

namespace lan_sweep::platform
{
    // Sends one ICMP echo request with libtins and waits for the reply on a
    // filtered sniffer. Needs raw socket access (root or CAP_NET_RAW).
    // The interface is resolved once; its own address is reported alive
    // without sending anything, since the reply never crosses the wire.
    class IcmpProber : public sweep::Prober
    {
    public:
        // Throws common::ConfigResolutionError when the interface cannot be resolved.
        IcmpProber(const std::string &interfaceName, bool verbose);

        bool IsAlive(common::Address addr, std::chrono::milliseconds timeout) override;

        const std::string &InterfaceName() const { return m_interfaceName; }
        common::Address LocalAddress() const { return m_localAddress; }

    private:
        std::string m_interfaceName;
        common::Address m_localAddress = 0;
        bool m_verbose;
        std::atomic<std::uint16_t> m_sequence{0};
    };
}
