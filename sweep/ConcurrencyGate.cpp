#include "ConcurrencyGate.hpp"

#include <stdexcept>

namespace lan_sweep::sweep
{
    ConcurrencyGate::ConcurrencyGate(std::size_t limit) : m_limit(limit)
    {
        if (limit == 0)
            throw std::invalid_argument("ConcurrencyGate limit must be at least 1");
    }

    void ConcurrencyGate::Acquire()
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_cv.wait(lock, [this]
                  { return m_inUse < m_limit; });
        ++m_inUse;
    }

    void ConcurrencyGate::Release()
    {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_inUse > 0)
                --m_inUse;
        }
        m_cv.notify_one();
    }

    std::size_t ConcurrencyGate::InUse() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_inUse;
    }
}
