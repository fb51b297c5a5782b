#pragma once

#include <cstddef>
#include <mutex>
#include <vector>
#include "../common/Address.hpp"

namespace lan_sweep::sweep
{
    // Sink for alive addresses, safe for any number of concurrent producers.
    // No deduplication is done.
    class ResultCollector
    {
    public:
        void Add(common::Address addr);

        // Hands out everything received so far and leaves the collector empty.
        std::vector<common::Address> Drain();

        std::size_t Size() const;

    private:
        std::vector<common::Address> m_alive;
        mutable std::mutex m_mutex;
    };
}
