#include "ResultCollector.hpp"

namespace lan_sweep::sweep
{
    void ResultCollector::Add(common::Address addr)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_alive.push_back(addr);
    }

    std::vector<common::Address> ResultCollector::Drain()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::vector<common::Address> out;
        out.swap(m_alive);
        return out;
    }

    std::size_t ResultCollector::Size() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_alive.size();
    }
}
