#pragma once

#include <stdexcept>
#include <string>

namespace lan_sweep::common
{
    class SweepError : public std::runtime_error
    {
    public:
        explicit SweepError(const std::string &what) : std::runtime_error(what) {}
    };

    // Interface introspection failed or returned nothing usable.
    class ConfigResolutionError : public SweepError
    {
    public:
        explicit ConfigResolutionError(const std::string &what) : SweepError(what) {}
    };

    // Address or mask cannot form a valid IPv4 subnet.
    class InvalidNetworkConfig : public SweepError
    {
    public:
        explicit InvalidNetworkConfig(const std::string &what) : SweepError(what) {}
    };
}
