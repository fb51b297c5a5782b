#pragma once

#include <cstdint>
#include <iterator>
#include <string>
#include "../common/Address.hpp"

namespace lan_sweep::sweep
{
    using common::Address;

    struct Subnet
    {
        Address network = 0;
        int prefix = 0;

        Address Mask() const { return common::PrefixToMask(prefix); }
        Address Broadcast() const { return network | ~Mask(); }
        std::uint64_t UsableHostCount() const;
        std::string ToString() const;
    };

    // Lazy ascending sequence of the usable host addresses of a subnet.
    class AddressRange
    {
    public:
        class Iterator
        {
        public:
            using iterator_category = std::input_iterator_tag;
            using value_type = Address;
            using difference_type = std::int64_t;
            using pointer = const Address *;
            using reference = Address;

            Iterator() = default;
            explicit Iterator(std::uint64_t pos) : m_pos(pos) {}

            Address operator*() const { return static_cast<Address>(m_pos); }
            Iterator &operator++()
            {
                ++m_pos;
                return *this;
            }
            Iterator operator++(int)
            {
                Iterator tmp = *this;
                ++m_pos;
                return tmp;
            }
            bool operator==(const Iterator &other) const { return m_pos == other.m_pos; }
            bool operator!=(const Iterator &other) const { return m_pos != other.m_pos; }

        private:
            std::uint64_t m_pos = 0;
        };

        AddressRange() = default;
        explicit AddressRange(const Subnet &subnet);

        Iterator begin() const { return Iterator(m_first); }
        Iterator end() const { return Iterator(m_end); }

        std::uint64_t Size() const { return m_end - m_first; }
        bool Empty() const { return m_end == m_first; }
        const Subnet &GetSubnet() const { return m_subnet; }

    private:
        Subnet m_subnet;
        std::uint64_t m_first = 0;
        std::uint64_t m_end = 0;
    };

    class AddressRangeResolver
    {
    public:
        // Throws common::InvalidNetworkConfig when the inputs do not form a subnet.
        static AddressRange Resolve(const std::string &localAddress, const std::string &netmaskOrPrefix);

        static AddressRange Resolve(Address localAddress, int prefix);
    };
}
