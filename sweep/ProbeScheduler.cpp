#include "ProbeScheduler.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <system_error>
#include <thread>

namespace lan_sweep::sweep
{
    ProbeScheduler::ProbeScheduler(std::size_t concurrencyLimit) : m_limit(concurrencyLimit)
    {
        if (concurrencyLimit == 0)
            throw std::invalid_argument("concurrency limit must be at least 1");
    }

    std::vector<Address> ProbeScheduler::Scan(const AddressRange &addresses, const ProbeFunction &probe)
    {
        return Run(addresses, addresses.Size(), probe);
    }

    std::vector<Address> ProbeScheduler::Scan(const std::vector<Address> &addresses, const ProbeFunction &probe)
    {
        return Run(addresses, addresses.size(), probe);
    }

    template <typename Range>
    std::vector<Address> ProbeScheduler::Run(const Range &addresses, std::uint64_t total, const ProbeFunction &probe)
    {
        m_wasCancelled = false;
        if (total == 0)
            return {};

        std::size_t workerCount = static_cast<std::size_t>(std::min<std::uint64_t>(m_limit, total));
        ScanState state(workerCount * 2, m_limit, total);

        std::vector<std::thread> workers;
        workers.reserve(workerCount);

        auto joinAll = [&workers]()
        {
            for (auto &t : workers)
            {
                if (t.joinable())
                    t.join();
            }
        };

        try
        {
            for (std::size_t i = 0; i < workerCount; ++i)
                workers.emplace_back(&ProbeScheduler::WorkerLoop, this, std::ref(state), std::cref(probe));
        }
        catch (const std::system_error &e)
        {
            std::cerr << "[ProbeScheduler] Failed to start worker: " << e.what() << "\n";
            state.queue.Close();
            joinAll();
            throw;
        }

        // Addresses are generated lazily; the bounded queue keeps the producer
        // at most a couple of items per worker ahead.
        for (Address addr : addresses)
        {
            if (IsCancelled())
            {
                state.skipped = true;
                break;
            }
            if (!state.queue.Push(addr))
                break;
        }

        state.queue.Close();
        if (IsCancelled())
        {
            std::size_t dropped = state.queue.Clear();
            if (dropped > 0)
                state.skipped = true;
            if (m_verbose)
                std::cerr << "[ProbeScheduler] Cancelled, " << dropped << " queued probes dropped\n";
        }

        joinAll();
        m_wasCancelled = state.skipped.load();
        return state.collector.Drain();
    }

    void ProbeScheduler::WorkerLoop(ScanState &state, const ProbeFunction &probe)
    {
        while (auto addr = state.queue.Pop())
        {
            if (IsCancelled())
            {
                state.skipped = true;
                continue;
            }

            bool alive = false;
            {
                GateSlot slot(state.gate);
                try
                {
                    alive = probe(*addr);
                }
                catch (const std::exception &e)
                {
                    if (m_verbose)
                        std::cerr << "[ProbeScheduler] Probe of " << common::FormatAddress(*addr)
                                  << " failed: " << e.what() << "\n";
                    alive = false;
                }
                catch (...)
                {
                    if (m_verbose)
                        std::cerr << "[ProbeScheduler] Probe of " << common::FormatAddress(*addr)
                                  << " failed with an unknown error\n";
                    alive = false;
                }
            }

            if (alive)
                state.collector.Add(*addr);

            std::uint64_t done = ++state.probed;
            if (m_progress)
                m_progress(done, state.total);
        }
    }
}
