#pragma once

#include <memory>
#include "../sweep/Prober.hpp"
#include "../sweep/SweepConfig.hpp"

namespace lan_sweep::platform
{
    bool IsRoot();

    // Auto picks ICMP when raw sockets are available, otherwise `ping`.
    // Throws common::ConfigResolutionError when the ICMP interface cannot be opened.
    std::unique_ptr<sweep::Prober> MakeProber(const sweep::SweepConfig &config);
}
