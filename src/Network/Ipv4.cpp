#include "Network/Ipv4.hpp"
#include <boost/system/error_code.hpp>
#include <charconv>
#include <limits>
#include <stdexcept>
#include <string>

namespace NETWORK {

namespace {

std::string_view trim(std::string_view s) {
    const auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string_view::npos) return {};
    const auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

std::optional<unsigned short> prefixFromBits(std::uint32_t bits) {
    // Contiguous masks are ones followed by zeros: ~bits + 1 is a power of two.
    const std::uint32_t inverted = ~bits;
    if ((inverted & (inverted + 1)) != 0) return std::nullopt;
    unsigned short len = 0;
    while (bits & 0x80000000u) {
        ++len;
        bits <<= 1;
    }
    return len;
}

} // namespace

std::optional<Ipv4Address> parseIpv4(std::string_view text) {
    text = trim(text);
    if (text.empty()) return std::nullopt;
    boost::system::error_code ec;
    auto addr = boost::asio::ip::make_address_v4(std::string(text), ec);
    if (ec) return std::nullopt;
    return addr;
}

std::optional<unsigned short> parsePrefixLength(std::string_view mask) {
    mask = trim(mask);
    if (mask.empty()) return std::nullopt;

    if (mask.size() > 2 && mask[0] == '0' && (mask[1] == 'x' || mask[1] == 'X')) {
        std::uint32_t bits = 0;
        auto [ptr, ec] = std::from_chars(mask.data() + 2, mask.data() + mask.size(), bits, 16);
        if (ec != std::errc{} || ptr != mask.data() + mask.size()) return std::nullopt;
        return prefixFromBits(bits);
    }

    if (mask.find('.') != std::string_view::npos) {
        auto dotted = parseIpv4(mask);
        if (!dotted) return std::nullopt;
        return prefixFromBits(dotted->to_uint());
    }

    if (mask.front() == '/') mask.remove_prefix(1);
    unsigned int len = 0;
    auto [ptr, ec] = std::from_chars(mask.data(), mask.data() + mask.size(), len);
    if (ec != std::errc{} || ptr != mask.data() + mask.size() || len > 32) return std::nullopt;
    return static_cast<unsigned short>(len);
}

Ipv4Network cidrFromAddressAndMask(const Ipv4Address& host, std::string_view mask) {
    auto prefix = parsePrefixLength(mask);
    if (!prefix) return fallbackNetwork(host);
    return Ipv4Network(host, *prefix).canonical();
}

Ipv4Network fallbackNetwork(const Ipv4Address& host) {
    return Ipv4Network(Ipv4Address(host.to_uint() & 0xffffff00u), 24);
}

HostRange::HostRange(const Ipv4Network& network) noexcept {
    const auto prefix = network.prefix_length();
    const std::uint32_t base = network.network().to_uint();
    if (prefix == 32) {
        first_ = base;
        size_ = 1;
    } else if (prefix == 31) {
        first_ = base;
        size_ = 2;
    } else {
        first_ = base + 1;
        size_ = (std::uint64_t{1} << (32 - prefix)) - 2;
    }
}

Ipv4Address HostRange::at(std::uint64_t index) const noexcept {
    return Ipv4Address(static_cast<std::uint32_t>(first_ + index));
}

std::optional<std::uint64_t> HostRange::indexOf(const Ipv4Address& addr) const noexcept {
    const std::uint32_t v = addr.to_uint();
    if (v < first_) return std::nullopt;
    const std::uint64_t index = v - first_;
    if (index >= size_) return std::nullopt;
    return index;
}

Ipv4Address offsetAddress(const Ipv4Address& addr, std::uint32_t step) noexcept {
    const std::uint64_t v = std::uint64_t{addr.to_uint()} + step;
    if (v > std::numeric_limits<std::uint32_t>::max()) {
        return Ipv4Address(std::numeric_limits<std::uint32_t>::max());
    }
    return Ipv4Address(static_cast<std::uint32_t>(v));
}

} // namespace NETWORK
