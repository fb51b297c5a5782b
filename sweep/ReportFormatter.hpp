#pragma once

#include <cstddef>
#include <ostream>
#include <string>
#include <utility>
#include <vector>
#include "AddressRange.hpp"

namespace lan_sweep::sweep
{
    class ScanReport
    {
    public:
        explicit ScanReport(std::vector<Address> alive) : m_alive(std::move(alive)) {}

        const std::vector<Address> &Alive() const { return m_alive; }
        std::size_t Count() const { return m_alive.size(); }

    private:
        std::vector<Address> m_alive;
    };

    struct ScanTarget
    {
        std::string interfaceName;
        Address localAddress = 0;
        Subnet subnet;
    };

    // Display-only context gathered at the prompt.
    struct NetworkContext
    {
        std::string networkName;
        bool credentialProvided = false;
    };

    struct DisplayConfig
    {
        std::string title = "LAN Sweep";
        std::string bullet = "-";
        bool useColor = false;
    };

    class ReportFormatter
    {
    public:
        // Sorts by numeric address value.
        static ScanReport Format(std::vector<Address> alive);

        static void RenderHeader(std::ostream &out, const DisplayConfig &display, const NetworkContext &context);
        static void RenderTarget(std::ostream &out, const DisplayConfig &display, const ScanTarget &target);
        static void RenderReport(std::ostream &out, const DisplayConfig &display, const ScanReport &report, bool interrupted = false);
    };
}
