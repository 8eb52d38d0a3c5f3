#pragma once
#include <boost/asio/ip/address_v4.hpp>
#include <boost/asio/ip/network_v4.hpp>
#include <cstdint>
#include <optional>
#include <string_view>

namespace NETWORK {

using Ipv4Address = boost::asio::ip::address_v4;
using Ipv4Network = boost::asio::ip::network_v4;

[[nodiscard]] std::optional<Ipv4Address> parseIpv4(std::string_view text);

/**
 * @brief Reads a netmask as a prefix length
 *
 * Accepts dotted quads ("255.255.255.0"), prefix lengths ("24" or "/24") and
 * hex masks as printed by BSD ifconfig ("0xffffff00"). Non-contiguous masks
 * are rejected.
 */
[[nodiscard]] std::optional<unsigned short> parsePrefixLength(std::string_view mask);

/**
 * @brief Network containing host under the given mask
 *
 * When the mask does not parse this falls back to host's /24. That fallback
 * is a guess and can name the wrong network on anything but a /24 LAN.
 */
[[nodiscard]] Ipv4Network cidrFromAddressAndMask(const Ipv4Address& host, std::string_view mask);

// The /24 built from the first three octets of host.
[[nodiscard]] Ipv4Network fallbackNetwork(const Ipv4Address& host);

/**
 * @brief Enumerable hosts of a network as an indexable range
 *
 * Prefix <= 30 excludes network and broadcast, /31 holds both addresses and
 * /32 its single address.
 */
class HostRange {
public:
    explicit HostRange(const Ipv4Network& network) noexcept;

    [[nodiscard]] std::uint64_t size() const noexcept { return size_; }
    [[nodiscard]] bool empty() const noexcept { return size_ == 0; }
    [[nodiscard]] Ipv4Address at(std::uint64_t index) const noexcept;
    [[nodiscard]] std::optional<std::uint64_t> indexOf(const Ipv4Address& addr) const noexcept;
    [[nodiscard]] Ipv4Address first() const noexcept { return at(0); }

private:
    std::uint32_t first_{0};
    std::uint64_t size_{0};
};

// addr + step, saturating at 255.255.255.255.
[[nodiscard]] Ipv4Address offsetAddress(const Ipv4Address& addr, std::uint32_t step) noexcept;

} // namespace NETWORK
