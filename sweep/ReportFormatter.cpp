#include "ReportFormatter.hpp"

#include <algorithm>

namespace lan_sweep::sweep
{
    namespace
    {
        const char *const ANSI_BOLD = "\033[1m";
        const char *const ANSI_GREEN = "\033[32m";
        const char *const ANSI_YELLOW = "\033[33m";
        const char *const ANSI_RESET = "\033[0m";

        std::string Paint(const DisplayConfig &display, const char *code, const std::string &text)
        {
            if (!display.useColor)
                return text;
            return std::string(code) + text + ANSI_RESET;
        }
    }

    ScanReport ReportFormatter::Format(std::vector<Address> alive)
    {
        std::sort(alive.begin(), alive.end());
        return ScanReport(std::move(alive));
    }

    void ReportFormatter::RenderHeader(std::ostream &out, const DisplayConfig &display, const NetworkContext &context)
    {
        std::string rule(display.title.size() + 4, '=');
        out << Paint(display, ANSI_BOLD, rule) << "\n";
        out << Paint(display, ANSI_BOLD, "  " + display.title) << "\n";
        out << Paint(display, ANSI_BOLD, rule) << "\n";

        if (!context.networkName.empty())
        {
            out << "Network: " << context.networkName;
            if (context.credentialProvided)
                out << " (credential provided)";
            out << "\n";
        }
    }

    void ReportFormatter::RenderTarget(std::ostream &out, const DisplayConfig &display, const ScanTarget &target)
    {
        out << "Scanning " << Paint(display, ANSI_BOLD, target.subnet.ToString())
            << " (" << target.subnet.UsableHostCount() << " hosts)";
        if (!target.interfaceName.empty())
            out << " on " << target.interfaceName;
        out << " from " << common::FormatAddress(target.localAddress) << "\n";
    }

    void ReportFormatter::RenderReport(std::ostream &out, const DisplayConfig &display, const ScanReport &report, bool interrupted)
    {
        if (interrupted)
            out << Paint(display, ANSI_YELLOW, "Scan interrupted, results are partial") << "\n";

        out << "Live devices found: " << Paint(display, ANSI_GREEN, std::to_string(report.Count())) << "\n";
        for (Address addr : report.Alive())
            out << "  " << display.bullet << " " << common::FormatAddress(addr) << "\n";
    }
}
