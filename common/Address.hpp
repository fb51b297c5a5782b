#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace lan_sweep::common
{
    // IPv4 address in host byte order. Ordering is the numeric one.
    using Address = std::uint32_t;

    std::optional<Address> ParseAddress(const std::string &text);

    std::string FormatAddress(Address addr);

    // Accepts "255.255.255.0", "24" or "/24". Returns the prefix length.
    std::optional<int> ParsePrefix(const std::string &text);

    std::optional<int> MaskToPrefixLength(Address mask);

    Address PrefixToMask(int prefix);
}
