#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include "ReportFormatter.hpp"

namespace lan_sweep::sweep
{
    inline constexpr std::size_t DEFAULT_CONCURRENCY = 100;
    inline constexpr std::size_t MAX_CONCURRENCY = 1024;
    inline constexpr std::chrono::milliseconds DEFAULT_PROBE_TIMEOUT{1000};
    inline constexpr std::chrono::milliseconds MAX_PROBE_TIMEOUT{60000};

    enum class ProberKind
    {
        Auto,
        Icmp,
        Ping
    };

    struct SweepConfig
    {
        std::size_t concurrency = DEFAULT_CONCURRENCY;
        std::chrono::milliseconds probeTimeout = DEFAULT_PROBE_TIMEOUT;
        ProberKind prober = ProberKind::Auto;

        // Empty means the default interface.
        std::string interfaceName;

        // When both are set, interface introspection is skipped.
        std::string address;
        std::string netmask;

        bool verbose = false;
        NetworkContext network;
        DisplayConfig display;
    };
}
