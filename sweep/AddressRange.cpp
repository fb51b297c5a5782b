#include "AddressRange.hpp"
#include "../common/Errors.hpp"

namespace lan_sweep::sweep
{
    std::uint64_t Subnet::UsableHostCount() const
    {
        if (prefix >= 31)
            return 0;
        return (std::uint64_t{1} << (32 - prefix)) - 2;
    }

    std::string Subnet::ToString() const
    {
        return common::FormatAddress(network) + "/" + std::to_string(prefix);
    }

    AddressRange::AddressRange(const Subnet &subnet) : m_subnet(subnet)
    {
        // /31 and /32 have no usable hosts; begin == end.
        if (subnet.prefix >= 31)
        {
            m_first = m_end = subnet.network;
            return;
        }

        m_first = static_cast<std::uint64_t>(subnet.network) + 1;
        m_end = static_cast<std::uint64_t>(subnet.Broadcast());
    }

    AddressRange AddressRangeResolver::Resolve(const std::string &localAddress, const std::string &netmaskOrPrefix)
    {
        auto addr = common::ParseAddress(localAddress);
        if (!addr)
            throw common::InvalidNetworkConfig("invalid local address '" + localAddress + "'");

        auto prefix = common::ParsePrefix(netmaskOrPrefix);
        if (!prefix)
            throw common::InvalidNetworkConfig("invalid netmask or prefix '" + netmaskOrPrefix + "'");

        return Resolve(*addr, *prefix);
    }

    AddressRange AddressRangeResolver::Resolve(Address localAddress, int prefix)
    {
        if (prefix < 0 || prefix > 32)
            throw common::InvalidNetworkConfig("prefix length " + std::to_string(prefix) + " out of range");

        Subnet subnet;
        subnet.prefix = prefix;
        subnet.network = localAddress & subnet.Mask();
        return AddressRange(subnet);
    }
}
