#include "../sweep/SweepRunner.hpp"
#include "../common/Errors.hpp"
#include <catch2/catch.hpp>

#include <atomic>
#include <set>
#include <sstream>

using namespace lan_sweep;

namespace
{
    class StubProber : public sweep::Prober
    {
    public:
        explicit StubProber(std::set<std::string> alive) : m_alive(std::move(alive)) {}

        bool IsAlive(common::Address addr, std::chrono::milliseconds) override
        {
            ++m_calls;
            return m_alive.count(common::FormatAddress(addr)) > 0;
        }

        int Calls() const { return m_calls.load(); }

    private:
        std::set<std::string> m_alive;
        std::atomic<int> m_calls{0};
    };

    // Cancels the sweep while answering for the given address.
    class CancellingProber : public sweep::Prober
    {
    public:
        CancellingProber(sweep::CancellationToken &token, common::Address trigger)
            : m_token(token), m_trigger(trigger) {}

        bool IsAlive(common::Address addr, std::chrono::milliseconds) override
        {
            if (addr == m_trigger)
                m_token.Cancel();
            return true;
        }

    private:
        sweep::CancellationToken &m_token;
        common::Address m_trigger;
    };

    sweep::InterfaceAddress Iface(const std::string &addr, const std::string &mask)
    {
        sweep::InterfaceAddress iface;
        iface.name = "eth0";
        iface.address = addr;
        iface.netmask = mask;
        return iface;
    }
}

TEST_CASE("Sweep of a /24 reports the responders in order")
{
    sweep::SweepConfig config;
    sweep::FixedInterfaceInspector inspector(Iface("192.168.1.10", "255.255.255.0"));
    StubProber prober(std::set<std::string>{"192.168.1.50", "192.168.1.1"});

    sweep::SweepRunner runner(config, inspector, prober);
    std::ostringstream out;
    auto report = runner.Run(out);

    REQUIRE(prober.Calls() == 254);
    REQUIRE(report.Count() == 2);
    REQUIRE(common::FormatAddress(report.Alive()[0]) == "192.168.1.1");
    REQUIRE(common::FormatAddress(report.Alive()[1]) == "192.168.1.50");
    REQUIRE(runner.State() == sweep::RunState::Reported);
    REQUIRE_FALSE(runner.Interrupted());

    const std::string text = out.str();
    REQUIRE(text.find("Scanning 192.168.1.0/24 (254 hosts) on eth0 from 192.168.1.10") != std::string::npos);
    REQUIRE(text.find("Live devices found: 2") != std::string::npos);

    auto first = text.find("  - 192.168.1.1\n");
    auto second = text.find("  - 192.168.1.50\n");
    REQUIRE(first != std::string::npos);
    REQUIRE(second != std::string::npos);
    REQUIRE(first < second);
}

TEST_CASE("Missing interface configuration aborts before probing")
{
    sweep::SweepConfig config;
    sweep::FixedInterfaceInspector inspector(std::nullopt);
    StubProber prober(std::set<std::string>{"192.168.1.1"});

    sweep::SweepRunner runner(config, inspector, prober);
    std::ostringstream out;

    REQUIRE_THROWS_AS(runner.Run(out), common::ConfigResolutionError);
    REQUIRE(prober.Calls() == 0);
    REQUIRE(runner.State() == sweep::RunState::Idle);
}

TEST_CASE("Interface without an IPv4 address is a configuration error")
{
    sweep::SweepConfig config;
    sweep::FixedInterfaceInspector inspector(Iface("", ""));
    StubProber prober(std::set<std::string>{});

    sweep::SweepRunner runner(config, inspector, prober);
    std::ostringstream out;

    REQUIRE_THROWS_AS(runner.Run(out), common::ConfigResolutionError);
    REQUIRE(prober.Calls() == 0);
}

TEST_CASE("Invalid netmask aborts before probing")
{
    sweep::SweepConfig config;
    sweep::FixedInterfaceInspector inspector(Iface("192.168.1.10", "255.0.255.0"));
    StubProber prober(std::set<std::string>{"192.168.1.1"});

    sweep::SweepRunner runner(config, inspector, prober);
    std::ostringstream out;

    REQUIRE_THROWS_AS(runner.Run(out), common::InvalidNetworkConfig);
    REQUIRE(prober.Calls() == 0);
}

TEST_CASE("Point-to-point subnet completes with no hosts")
{
    sweep::SweepConfig config;
    sweep::FixedInterfaceInspector inspector(Iface("10.0.0.1", "32"));
    StubProber prober(std::set<std::string>{"10.0.0.1"});

    sweep::SweepRunner runner(config, inspector, prober);
    std::ostringstream out;
    auto report = runner.Run(out);

    REQUIRE(report.Count() == 0);
    REQUIRE(prober.Calls() == 0);
    REQUIRE(out.str().find("Live devices found: 0") != std::string::npos);
}

TEST_CASE("Resolving the target does not probe")
{
    sweep::SweepConfig config;
    sweep::FixedInterfaceInspector inspector(Iface("172.16.5.9", "/20"));
    StubProber prober(std::set<std::string>{});

    sweep::SweepRunner runner(config, inspector, prober);
    auto target = runner.ResolveTarget();

    REQUIRE(target.subnet.ToString() == "172.16.0.0/20");
    REQUIRE(target.subnet.UsableHostCount() == 4094);
    REQUIRE(common::FormatAddress(target.localAddress) == "172.16.5.9");
    REQUIRE(runner.State() == sweep::RunState::ConfigResolved);
    REQUIRE(prober.Calls() == 0);
}

TEST_CASE("A cancelled sweep still reports what it found")
{
    sweep::SweepConfig config;
    config.concurrency = 4;
    sweep::FixedInterfaceInspector inspector(Iface("10.1.0.1", "24"));
    StubProber prober(std::set<std::string>{"10.1.0.2", "10.1.0.3"});

    sweep::CancellationToken token;
    token.Cancel();

    sweep::SweepRunner runner(config, inspector, prober);
    runner.SetCancellationToken(&token);
    std::ostringstream out;
    auto report = runner.Run(out);

    REQUIRE(prober.Calls() == 0);
    REQUIRE(report.Count() == 0);
    REQUIRE(runner.Interrupted());
    REQUIRE(out.str().find("Scan interrupted") != std::string::npos);
}

TEST_CASE("Cancellation after the last probe keeps the report complete")
{
    sweep::SweepConfig config;
    config.concurrency = 1;
    sweep::FixedInterfaceInspector inspector(Iface("10.2.0.1", "29"));

    sweep::CancellationToken token;
    CancellingProber prober(token, *common::ParseAddress("10.2.0.6"));

    sweep::SweepRunner runner(config, inspector, prober);
    runner.SetCancellationToken(&token);
    std::ostringstream out;
    auto report = runner.Run(out);

    REQUIRE(token.IsCancelled());
    REQUIRE(report.Count() == 6);
    REQUIRE_FALSE(runner.Interrupted());
    REQUIRE(out.str().find("Scan interrupted") == std::string::npos);
}
