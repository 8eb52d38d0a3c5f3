#include "Network/MacAddress.hpp"
#include <boost/uuid/name_generator_sha1.hpp>
#include <boost/uuid/uuid.hpp>
#include <cstdio>

namespace NETWORK {

namespace {

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

std::optional<MacAddress> MacAddress::parse(std::string_view text) {
    if (text.empty()) return std::nullopt;
    const char sep = text.find('-') != std::string_view::npos ? '-' : ':';

    bytes_type bytes{};
    std::size_t octet = 0;
    std::size_t digits = 0;
    int value = 0;
    for (char c : text) {
        if (c == sep) {
            if (digits == 0 || octet >= 5) return std::nullopt;
            bytes[octet++] = static_cast<std::uint8_t>(value);
            digits = 0;
            value = 0;
            continue;
        }
        int v = hexValue(c);
        if (v < 0 || ++digits > 2) return std::nullopt;
        value = value * 16 + v;
    }
    if (digits == 0 || octet != 5) return std::nullopt;
    bytes[5] = static_cast<std::uint8_t>(value);
    return MacAddress(bytes);
}

std::string MacAddress::toString() const {
    char buf[18];
    std::snprintf(buf, sizeof(buf), "%02x:%02x:%02x:%02x:%02x:%02x",
                  bytes_[0], bytes_[1], bytes_[2], bytes_[3], bytes_[4], bytes_[5]);
    return std::string(buf);
}

std::string normalizeMac(std::string_view text) {
    auto mac = MacAddress::parse(text);
    return mac ? mac->toString() : std::string{};
}

MacAddressGenerator::MacAddressGenerator() : engine(std::random_device{}()) {}

MacAddressGenerator::MacAddressGenerator(std::uint32_t seed) : engine(seed) {}

MacAddressGenerator MacAddressGenerator::forName(std::string_view guestName) {
    return MacAddressGenerator(seedFromName(guestName));
}

std::uint32_t MacAddressGenerator::seedFromName(std::string_view guestName) {
    boost::uuids::name_generator_sha1 gen(boost::uuids::ns::dns());
    const boost::uuids::uuid id = gen(guestName.data(), guestName.size());
    return (std::uint32_t{id.data[0]} << 24) | (std::uint32_t{id.data[1]} << 16) |
           (std::uint32_t{id.data[2]} << 8) | std::uint32_t{id.data[3]};
}

MacAddress MacAddressGenerator::next(std::optional<std::uint8_t> lastOctet) {
    MacAddress::bytes_type bytes{kQemuPrefix[0], kQemuPrefix[1], kQemuPrefix[2], 0, 0, 0};
    bytes[3] = static_cast<std::uint8_t>(engine() & 0x7f);
    bytes[4] = static_cast<std::uint8_t>(engine() & 0xff);
    const auto drawn = static_cast<std::uint8_t>(engine() & 0xff);
    bytes[5] = lastOctet.value_or(drawn);
    return MacAddress(bytes);
}

} // namespace NETWORK
