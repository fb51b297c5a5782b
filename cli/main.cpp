#include "../common/Errors.hpp"
#include "../platform/ProberFactory.hpp"
#include "../platform/TinsInterfaceInspector.hpp"
#include "../sweep/SweepRunner.hpp"

#include <boost/program_options.hpp>

#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <termios.h>
#include <unistd.h>

namespace po = boost::program_options;
using namespace lan_sweep;

namespace
{
    constexpr int EXIT_CONFIG_ERROR = 1;
    constexpr int EXIT_USAGE = 2;
    constexpr int EXIT_INTERRUPTED = 130;

    sweep::CancellationToken g_cancel;

    void HandleSigint(int)
    {
        g_cancel.Cancel();
    }

    std::string PromptLine(const std::string &label, bool hideInput)
    {
        std::cout << label << std::flush;

        struct termios saved;
        bool restore = false;
        if (hideInput && tcgetattr(STDIN_FILENO, &saved) == 0)
        {
            struct termios quiet = saved;
            quiet.c_lflag &= ~static_cast<tcflag_t>(ECHO);
            restore = tcsetattr(STDIN_FILENO, TCSANOW, &quiet) == 0;
        }

        std::string line;
        std::getline(std::cin, line);

        if (restore)
        {
            tcsetattr(STDIN_FILENO, TCSANOW, &saved);
            std::cout << "\n";
        }
        return line;
    }

    sweep::ProberKind ParseProberKind(const std::string &name)
    {
        if (name == "auto")
            return sweep::ProberKind::Auto;
        if (name == "icmp")
            return sweep::ProberKind::Icmp;
        if (name == "ping")
            return sweep::ProberKind::Ping;
        throw po::validation_error(po::validation_error::invalid_option_value, "prober", name);
    }
}

int main(int argc, char **argv)
{
    sweep::SweepConfig config;
    std::string proberName = "auto";
    std::size_t timeoutMs = static_cast<std::size_t>(sweep::DEFAULT_PROBE_TIMEOUT.count());
    bool noPrompt = false;
    bool noColor = false;

    po::options_description desc("Usage: lan_sweep [options]\n\nDiscover live hosts on the local IPv4 subnet.\n\nOptions");
    desc.add_options()
        ("help,h", "show this help")
        ("concurrency,c", po::value<std::size_t>(&config.concurrency)->default_value(sweep::DEFAULT_CONCURRENCY),
         "maximum probes in flight")
        ("timeout-ms,t", po::value<std::size_t>(&timeoutMs)->default_value(timeoutMs),
         "per-probe timeout in milliseconds")
        ("prober", po::value<std::string>(&proberName)->default_value(proberName),
         "probe mechanism: auto, icmp or ping")
        ("interface,i", po::value<std::string>(&config.interfaceName),
         "interface to derive the subnet from (default: default route)")
        ("address", po::value<std::string>(&config.address), "local address, skips interface lookup")
        ("netmask", po::value<std::string>(&config.netmask), "netmask or prefix length, used with --address")
        ("ssid", po::value<std::string>(&config.network.networkName), "network name shown in the header")
        ("no-prompt", po::bool_switch(&noPrompt), "do not ask for network name and credential")
        ("no-color", po::bool_switch(&noColor), "disable ANSI colors")
        ("verbose,v", po::bool_switch(&config.verbose), "log progress to stderr");

    try
    {
        po::variables_map vm;
        po::store(po::parse_command_line(argc, argv, desc), vm);

        if (vm.count("help"))
        {
            std::cout << desc << "\n";
            return 0;
        }

        po::notify(vm);

        config.prober = ParseProberKind(proberName);

        if (config.concurrency == 0 || config.concurrency > sweep::MAX_CONCURRENCY)
            throw po::validation_error(po::validation_error::invalid_option_value, "concurrency",
                                       std::to_string(config.concurrency));

        if (timeoutMs == 0 || timeoutMs > static_cast<std::size_t>(sweep::MAX_PROBE_TIMEOUT.count()))
            throw po::validation_error(po::validation_error::invalid_option_value, "timeout-ms",
                                       std::to_string(timeoutMs));
        config.probeTimeout = std::chrono::milliseconds(timeoutMs);

        if (config.address.empty() != config.netmask.empty())
            throw po::error("--address and --netmask must be given together");
    }
    catch (const po::error &e)
    {
        std::cerr << "lan_sweep: " << e.what() << "\n\n"
                  << desc << "\n";
        return EXIT_USAGE;
    }

    config.display.useColor = !noColor && isatty(STDOUT_FILENO);

    bool interactive = !noPrompt && isatty(STDIN_FILENO);
    if (interactive && config.network.networkName.empty())
    {
        config.network.networkName = PromptLine("Network name: ", false);
        // Only whether one was typed is kept; the text itself goes nowhere.
        config.network.credentialProvided = !PromptLine("Network password: ", true).empty();
    }

    std::unique_ptr<sweep::InterfaceInspector> inspector;
    if (!config.address.empty())
    {
        sweep::InterfaceAddress fixed;
        fixed.name = config.interfaceName;
        fixed.address = config.address;
        fixed.netmask = config.netmask;
        inspector = std::make_unique<sweep::FixedInterfaceInspector>(fixed);
    }
    else
    {
        inspector = std::make_unique<platform::TinsInterfaceInspector>(config.interfaceName);
    }

    std::unique_ptr<sweep::Prober> prober;
    try
    {
        prober = platform::MakeProber(config);
    }
    catch (const common::SweepError &e)
    {
        std::cerr << "[lan_sweep] ERROR: " << e.what() << "\n";
        return EXIT_CONFIG_ERROR;
    }

    std::signal(SIGINT, HandleSigint);

    sweep::SweepRunner runner(config, *inspector, *prober);
    runner.SetCancellationToken(&g_cancel);

    try
    {
        runner.Run(std::cout);
    }
    catch (const common::SweepError &e)
    {
        std::cerr << "[lan_sweep] ERROR: " << e.what() << "\n";
        return EXIT_CONFIG_ERROR;
    }
    catch (const std::exception &e)
    {
        std::cerr << "Fatal Error: " << e.what() << '\n';
        return EXIT_CONFIG_ERROR;
    }

    return runner.Interrupted() ? EXIT_INTERRUPTED : 0;
}
