#pragma once

#include <ostream>
#include "ConcurrencyGate.hpp"
#include "InterfaceInspector.hpp"
#include "Prober.hpp"
#include "ReportFormatter.hpp"
#include "SweepConfig.hpp"

namespace lan_sweep::sweep
{
    enum class RunState
    {
        Idle,
        ConfigResolved,
        RangeComputed,
        ScanInFlight,
        ScanComplete,
        Reported
    };

    const char *ToString(RunState state);

    // Drives one sweep: resolve the local subnet, probe it, print the report.
    class SweepRunner
    {
    public:
        SweepRunner(const SweepConfig &config, InterfaceInspector &inspector, Prober &prober);

        void SetCancellationToken(const CancellationToken *token) { m_cancel = token; }

        // Throws common::ConfigResolutionError or common::InvalidNetworkConfig
        // before any probe is sent. The report is written to `out`.
        ScanReport Run(std::ostream &out);

        // Only the configuration phase: what Run would scan.
        ScanTarget ResolveTarget();

        RunState State() const { return m_state; }
        bool Interrupted() const { return m_interrupted; }

    private:
        void Advance(RunState next);

        const SweepConfig &m_config;
        InterfaceInspector &m_inspector;
        Prober &m_prober;
        const CancellationToken *m_cancel = nullptr;
        RunState m_state = RunState::Idle;
        bool m_interrupted = false;
    };
}
