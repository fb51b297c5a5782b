#pragma once

#include "../sweep/Prober.hpp"

namespace lan_sweep::platform
{
    // Runs the system `ping` once per address. Works without privileges.
    class PingCommandProber : public sweep::Prober
    {
    public:
        bool IsAlive(common::Address addr, std::chrono::milliseconds timeout) override;
    };
}
