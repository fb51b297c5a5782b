#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace lan_sweep::sweep
{
    // Counting admission gate: at most `limit` holders at once.
    class ConcurrencyGate
    {
    public:
        explicit ConcurrencyGate(std::size_t limit);

        ConcurrencyGate(const ConcurrencyGate &) = delete;
        ConcurrencyGate &operator=(const ConcurrencyGate &) = delete;

        void Acquire();
        void Release();

        std::size_t InUse() const;

    private:
        std::size_t m_limit;
        std::size_t m_inUse = 0;
        mutable std::mutex m_mutex;
        std::condition_variable m_cv;
    };

    // Holds one slot of a gate for its lifetime.
    class GateSlot
    {
    public:
        explicit GateSlot(ConcurrencyGate &gate) : m_gate(gate) { m_gate.Acquire(); }
        ~GateSlot() { m_gate.Release(); }

        GateSlot(const GateSlot &) = delete;
        GateSlot &operator=(const GateSlot &) = delete;

    private:
        ConcurrencyGate &m_gate;
    };

    class CancellationToken
    {
    public:
        void Cancel() { m_cancelled.store(true); }
        bool IsCancelled() const { return m_cancelled.load(); }

    private:
        std::atomic<bool> m_cancelled{false};
    };
}
