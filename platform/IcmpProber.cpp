#include "IcmpProber.hpp"
#include "../common/Errors.hpp"

#include <tins/tins.h>
#include <poll.h>
#include <cerrno>
#include <iostream>

namespace lan_sweep::platform
{
    namespace
    {
        constexpr std::uint16_t ICMP_ID = 0x1337;
    }

    IcmpProber::IcmpProber(const std::string &interfaceName, bool verbose) : m_verbose(verbose)
    {
        try
        {
            Tins::NetworkInterface iface = interfaceName.empty()
                                               ? Tins::NetworkInterface::default_interface()
                                               : Tins::NetworkInterface(interfaceName);
            m_interfaceName = iface.name();
            m_localAddress = common::ParseAddress(iface.info().ip_addr.to_string()).value_or(0);
        }
        catch (const std::exception &e)
        {
            throw common::ConfigResolutionError(std::string("cannot open interface for ICMP probing: ") + e.what());
        }
    }

    bool IcmpProber::IsAlive(common::Address addr, std::chrono::milliseconds timeout)
    {
        if (m_localAddress != 0 && addr == m_localAddress)
            return true;

        std::string target = common::FormatAddress(addr);

        try
        {
            Tins::SnifferConfiguration config;
            config.set_promisc_mode(false);
            config.set_immediate_mode(true);
            config.set_filter("icmp[icmptype] == icmp-echoreply and src host " + target);
            config.set_timeout(static_cast<int>(timeout.count()));

            // Opened before sending so the reply cannot slip past.
            Tins::Sniffer sniffer(m_interfaceName, config);

            Tins::IP ip = Tins::IP(target) / Tins::ICMP();
            Tins::ICMP &icmp = ip.rfind_pdu<Tins::ICMP>();
            icmp.type(Tins::ICMP::ECHO_REQUEST);
            icmp.id(ICMP_ID);
            icmp.sequence(++m_sequence);

            Tins::PacketSender sender;
            sender.send(ip);

            auto deadline = std::chrono::steady_clock::now() + timeout;
            struct pollfd pfd;
            pfd.fd = sniffer.get_fd();
            pfd.events = POLLIN;

            while (true)
            {
                auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                    deadline - std::chrono::steady_clock::now());
                if (remaining.count() <= 0)
                    return false;

                int ready = poll(&pfd, 1, static_cast<int>(remaining.count()));
                if (ready < 0)
                {
                    if (errno == EINTR)
                        continue;
                    return false;
                }
                if (ready == 0)
                    return false;

                Tins::PtrPacket packet = sniffer.next_packet();
                if (packet)
                    return true;
            }
        }
        catch (const std::exception &e)
        {
            if (m_verbose)
                std::cerr << "[IcmpProber] " << target << ": " << e.what() << "\n";
            return false;
        }
    }
}
