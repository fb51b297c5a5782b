#pragma once

#include <chrono>
#include "../common/Address.hpp"

namespace lan_sweep::sweep
{
    // Single reachability check against one address.
    // Implementations return false for any failure of the mechanism itself.
    class Prober
    {
    public:
        virtual ~Prober() = default;
        virtual bool IsAlive(common::Address addr, std::chrono::milliseconds timeout) = 0;
    };
}
