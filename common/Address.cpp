#include "Address.hpp"

#include <arpa/inet.h>
#include <cctype>

namespace lan_sweep::common
{
    std::optional<Address> ParseAddress(const std::string &text)
    {
        struct in_addr addr;
        if (inet_pton(AF_INET, text.c_str(), &addr) != 1)
            return std::nullopt;
        return ntohl(addr.s_addr);
    }

    std::string FormatAddress(Address addr)
    {
        return std::to_string((addr >> 24) & 0xFF) + "." +
               std::to_string((addr >> 16) & 0xFF) + "." +
               std::to_string((addr >> 8) & 0xFF) + "." +
               std::to_string(addr & 0xFF);
    }

    std::optional<int> MaskToPrefixLength(Address mask)
    {
        int prefix = 0;
        while (prefix < 32 && (mask & (0x80000000u >> prefix)))
            ++prefix;

        // Anything left after the run of ones is a non-contiguous mask.
        if (mask != PrefixToMask(prefix))
            return std::nullopt;
        return prefix;
    }

    Address PrefixToMask(int prefix)
    {
        if (prefix <= 0)
            return 0;
        if (prefix >= 32)
            return 0xFFFFFFFFu;
        return 0xFFFFFFFFu << (32 - prefix);
    }

    std::optional<int> ParsePrefix(const std::string &text)
    {
        if (text.find('.') != std::string::npos)
        {
            auto mask = ParseAddress(text);
            if (!mask)
                return std::nullopt;
            return MaskToPrefixLength(*mask);
        }

        std::string digits = (!text.empty() && text[0] == '/') ? text.substr(1) : text;
        if (digits.empty() || digits.size() > 2)
            return std::nullopt;

        int prefix = 0;
        for (char c : digits)
        {
            if (!std::isdigit(static_cast<unsigned char>(c)))
                return std::nullopt;
            prefix = prefix * 10 + (c - '0');
        }

        if (prefix > 32)
            return std::nullopt;
        return prefix;
    }
}
