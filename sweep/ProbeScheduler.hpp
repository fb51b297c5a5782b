#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>
#include "AddressRange.hpp"
#include "ConcurrencyGate.hpp"
#include "ResultCollector.hpp"
#include "../common/BoundedQueue.hpp"

namespace lan_sweep::sweep
{
    // Runs one liveness probe per address on a fixed pool of workers,
    // never more than `concurrencyLimit` probes in flight.
    class ProbeScheduler
    {
    public:
        using ProbeFunction = std::function<bool(Address)>;
        using ProgressCallback = std::function<void(std::uint64_t probed, std::uint64_t total)>;

        explicit ProbeScheduler(std::size_t concurrencyLimit);

        void SetCancellationToken(const CancellationToken *token) { m_cancel = token; }
        void SetProgressCallback(ProgressCallback callback) { m_progress = std::move(callback); }
        void SetVerbose(bool verbose) { m_verbose = verbose; }

        // Returns the addresses whose probe returned true, in completion order.
        // A probe that throws counts as not alive. Blocks until every worker has
        // finished; when cancelled, returns what was collected up to that point.
        std::vector<Address> Scan(const AddressRange &addresses, const ProbeFunction &probe);
        std::vector<Address> Scan(const std::vector<Address> &addresses, const ProbeFunction &probe);

        // True when the last Scan left addresses unprobed because of cancellation.
        bool WasCancelled() const { return m_wasCancelled; }

    private:
        struct ScanState
        {
            ScanState(std::size_t queueCapacity, std::size_t gateLimit, std::uint64_t total)
                : queue(queueCapacity), gate(gateLimit), total(total) {}

            common::BoundedQueue<Address> queue;
            ConcurrencyGate gate;
            ResultCollector collector;
            std::atomic<std::uint64_t> probed{0};
            std::atomic<bool> skipped{false};
            std::uint64_t total;
        };

        template <typename Range>
        std::vector<Address> Run(const Range &addresses, std::uint64_t total, const ProbeFunction &probe);

        void WorkerLoop(ScanState &state, const ProbeFunction &probe);
        bool IsCancelled() const { return m_cancel && m_cancel->IsCancelled(); }

        std::size_t m_limit;
        const CancellationToken *m_cancel = nullptr;
        ProgressCallback m_progress;
        bool m_verbose = false;
        bool m_wasCancelled = false;
    };
}
