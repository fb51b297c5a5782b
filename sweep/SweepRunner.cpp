#include "SweepRunner.hpp"
#include "AddressRange.hpp"
#include "ProbeScheduler.hpp"
#include "../common/Errors.hpp"

#include <iostream>

namespace lan_sweep::sweep
{
    const char *ToString(RunState state)
    {
        switch (state)
        {
        case RunState::Idle:
            return "Idle";
        case RunState::ConfigResolved:
            return "ConfigResolved";
        case RunState::RangeComputed:
            return "RangeComputed";
        case RunState::ScanInFlight:
            return "ScanInFlight";
        case RunState::ScanComplete:
            return "ScanComplete";
        case RunState::Reported:
            return "Reported";
        }
        return "Unknown";
    }

    SweepRunner::SweepRunner(const SweepConfig &config, InterfaceInspector &inspector, Prober &prober)
        : m_config(config), m_inspector(inspector), m_prober(prober)
    {
    }

    void SweepRunner::Advance(RunState next)
    {
        m_state = next;
        if (m_config.verbose)
            std::cerr << "[SweepRunner] State: " << ToString(next) << "\n";
    }

    ScanTarget SweepRunner::ResolveTarget()
    {
        auto iface = m_inspector.Inspect();
        if (!iface.has_value())
            throw common::ConfigResolutionError("could not determine the local network configuration");

        if (iface->address.empty() || iface->netmask.empty())
            throw common::ConfigResolutionError("interface '" + iface->name + "' has no IPv4 address or netmask");

        Advance(RunState::ConfigResolved);

        AddressRange range = AddressRangeResolver::Resolve(iface->address, iface->netmask);

        ScanTarget target;
        target.interfaceName = iface->name;
        target.localAddress = *common::ParseAddress(iface->address);
        target.subnet = range.GetSubnet();
        return target;
    }

    ScanReport SweepRunner::Run(std::ostream &out)
    {
        m_interrupted = false;
        ReportFormatter::RenderHeader(out, m_config.display, m_config.network);

        ScanTarget target = ResolveTarget();
        AddressRange range(target.subnet);
        Advance(RunState::RangeComputed);

        ReportFormatter::RenderTarget(out, m_config.display, target);
        out.flush();

        ProbeScheduler scheduler(m_config.concurrency);
        scheduler.SetCancellationToken(m_cancel);
        scheduler.SetVerbose(m_config.verbose);
        if (m_config.verbose)
        {
            scheduler.SetProgressCallback([](std::uint64_t probed, std::uint64_t total)
                                          {
                if (probed == total || probed % 64 == 0)
                    std::cerr << "[SweepRunner] Probed " << probed << "/" << total << "\n"; });
        }

        auto timeout = m_config.probeTimeout;
        Advance(RunState::ScanInFlight);
        std::vector<Address> alive = scheduler.Scan(range, [this, timeout](Address addr)
                                                    { return m_prober.IsAlive(addr, timeout); });

        m_interrupted = scheduler.WasCancelled();
        Advance(RunState::ScanComplete);

        ScanReport report = ReportFormatter::Format(std::move(alive));
        ReportFormatter::RenderReport(out, m_config.display, report, m_interrupted);
        Advance(RunState::Reported);
        return report;
    }
}
