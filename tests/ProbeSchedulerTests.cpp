#include "../sweep/ProbeScheduler.hpp"
#include <catch2/catch.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <set>
#include <stdexcept>
#include <thread>

using namespace lan_sweep;
using sweep::ProbeScheduler;

namespace
{
    // Records how many probes run at the same time.
    class HighWaterProbe
    {
    public:
        bool operator()(common::Address addr)
        {
            int now = ++m_inFlight;
            int seen = m_highWater.load();
            while (now > seen && !m_highWater.compare_exchange_weak(seen, now))
            {
            }
            ++m_calls;
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
            --m_inFlight;
            return addr % 3 == 0;
        }

        int HighWater() const { return m_highWater.load(); }
        int Calls() const { return m_calls.load(); }

    private:
        std::atomic<int> m_inFlight{0};
        std::atomic<int> m_highWater{0};
        std::atomic<int> m_calls{0};
    };

    std::vector<common::Address> Sorted(std::vector<common::Address> v)
    {
        std::sort(v.begin(), v.end());
        return v;
    }
}

TEST_CASE("Scheduler never exceeds the concurrency limit")
{
    auto range = sweep::AddressRangeResolver::Resolve("10.0.0.1", "25");

    for (std::size_t limit : {1u, 4u, 16u})
    {
        HighWaterProbe probe;
        ProbeScheduler scheduler(limit);
        scheduler.Scan(range, [&probe](common::Address a)
                       { return probe(a); });

        REQUIRE(probe.HighWater() >= 1);
        REQUIRE(static_cast<std::size_t>(probe.HighWater()) <= limit);
        REQUIRE(probe.Calls() == 126);
    }
}

TEST_CASE("Result set does not depend on the concurrency limit")
{
    auto range = sweep::AddressRangeResolver::Resolve("192.168.7.1", "24");
    auto probe = [](common::Address a)
    { return (a & 0xFF) % 7 == 0; };

    std::vector<common::Address> expected;
    for (common::Address a : range)
    {
        if (probe(a))
            expected.push_back(a);
    }

    for (std::size_t limit : {1u, 8u, 100u, 1000u})
    {
        ProbeScheduler scheduler(limit);
        REQUIRE(Sorted(scheduler.Scan(range, probe)) == expected);
    }
}

TEST_CASE("Explicit address lists are scanned too")
{
    std::vector<common::Address> input = {5, 1, 9, 3};
    ProbeScheduler scheduler(2);

    auto alive = scheduler.Scan(input, [](common::Address a)
                                { return a > 2; });

    REQUIRE(Sorted(alive) == std::vector<common::Address>{3, 5, 9});
}

TEST_CASE("Empty input probes nothing")
{
    auto range = sweep::AddressRangeResolver::Resolve("10.0.0.1", "32");
    std::atomic<int> calls{0};
    ProbeScheduler scheduler(10);

    auto alive = scheduler.Scan(range, [&calls](common::Address)
                                { ++calls; return true; });

    REQUIRE(alive.empty());
    REQUIRE(calls.load() == 0);
}

TEST_CASE("Throwing probes count as not alive")
{
    auto range = sweep::AddressRangeResolver::Resolve("10.9.0.1", "28");
    ProbeScheduler scheduler(1);

    auto alive = scheduler.Scan(range, [](common::Address a)
                                {
        if (a % 2 == 1)
            throw std::runtime_error("spawn failed");
        return true; });

    REQUIRE(alive.size() == 7);
    for (common::Address a : alive)
        REQUIRE(a % 2 == 0);
}

TEST_CASE("Probes throwing non-standard values count as not alive")
{
    auto range = sweep::AddressRangeResolver::Resolve("10.9.0.1", "29");
    ProbeScheduler scheduler(2);

    auto alive = scheduler.Scan(range, [](common::Address a)
                                {
        if (a % 2 == 1)
            throw 42;
        return true; });

    REQUIRE(Sorted(alive) == std::vector<common::Address>{
                                 *common::ParseAddress("10.9.0.2"),
                                 *common::ParseAddress("10.9.0.4"),
                                 *common::ParseAddress("10.9.0.6")});
}

TEST_CASE("Zero concurrency is refused")
{
    REQUIRE_THROWS_AS(ProbeScheduler(0), std::invalid_argument);
}

TEST_CASE("Cancellation stops new probes and keeps partial results")
{
    auto range = sweep::AddressRangeResolver::Resolve("10.0.0.1", "22");
    sweep::CancellationToken token;
    std::atomic<int> calls{0};

    ProbeScheduler scheduler(2);
    scheduler.SetCancellationToken(&token);

    auto alive = scheduler.Scan(range, [&](common::Address)
                                {
        if (++calls == 10)
            token.Cancel();
        return true; });

    REQUIRE(calls.load() >= 10);
    REQUIRE(calls.load() <= 12);
    REQUIRE(alive.size() == static_cast<std::size_t>(calls.load()));
    REQUIRE(scheduler.WasCancelled());
}

TEST_CASE("Cancelling during the final probe is not a partial scan")
{
    auto range = sweep::AddressRangeResolver::Resolve("10.0.0.1", "28");
    const common::Address last = *common::ParseAddress("10.0.0.14");
    sweep::CancellationToken token;
    std::atomic<int> calls{0};

    ProbeScheduler scheduler(1);
    scheduler.SetCancellationToken(&token);

    auto alive = scheduler.Scan(range, [&](common::Address a)
                                {
        ++calls;
        if (a == last)
            token.Cancel();
        return true; });

    REQUIRE(calls.load() == 14);
    REQUIRE(alive.size() == 14);
    REQUIRE_FALSE(scheduler.WasCancelled());
}

TEST_CASE("Progress reaches the total")
{
    auto range = sweep::AddressRangeResolver::Resolve("10.0.0.1", "27");
    std::atomic<std::uint64_t> last{0};
    std::atomic<int> reports{0};
    std::atomic<bool> wrongTotal{false};

    ProbeScheduler scheduler(4);
    scheduler.SetProgressCallback([&](std::uint64_t probed, std::uint64_t total)
                                  {
        if (total != 30)
            wrongTotal = true;
        ++reports;
        std::uint64_t seen = last.load();
        while (probed > seen && !last.compare_exchange_weak(seen, probed))
        {
        } });

    scheduler.Scan(range, [](common::Address)
                   { return false; });

    REQUIRE_FALSE(wrongTotal.load());
    REQUIRE(reports.load() == 30);
    REQUIRE(last.load() == 30);
}
