#include "ProberFactory.hpp"
#include "IcmpProber.hpp"
#include "PingCommandProber.hpp"

#include <iostream>
#include <unistd.h>

namespace lan_sweep::platform
{
    bool IsRoot()
    {
        return geteuid() == 0;
    }

    std::unique_ptr<sweep::Prober> MakeProber(const sweep::SweepConfig &config)
    {
        sweep::ProberKind kind = config.prober;
        if (kind == sweep::ProberKind::Auto)
            kind = IsRoot() ? sweep::ProberKind::Icmp : sweep::ProberKind::Ping;

        if (kind == sweep::ProberKind::Icmp)
        {
            if (!IsRoot())
                std::cerr << "[ProberFactory] WARNING: ICMP probing without root, every probe will fail.\n";
            if (config.verbose)
                std::cerr << "[ProberFactory] Using ICMP echo prober\n";
            return std::make_unique<IcmpProber>(config.interfaceName, config.verbose);
        }

        if (config.verbose)
            std::cerr << "[ProberFactory] Using ping command prober\n";
        return std::make_unique<PingCommandProber>();
    }
}
