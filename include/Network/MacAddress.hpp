#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <string_view>

namespace NETWORK {

class MacAddress {
public:
    using bytes_type = std::array<std::uint8_t, 6>;

    MacAddress() = default;
    explicit MacAddress(const bytes_type& bytes) noexcept : bytes_(bytes) {}

    /**
     * @brief Parses a link-layer address
     *
     * Accepts ':' or '-' separators, either case, and one or two hex digits
     * per octet (BSD arp prints "52:54:0:a:b:c").
     */
    [[nodiscard]] static std::optional<MacAddress> parse(std::string_view text);

    // Lowercase, colon separated, zero padded.
    [[nodiscard]] std::string toString() const;

    [[nodiscard]] const bytes_type& bytes() const noexcept { return bytes_; }
    [[nodiscard]] bool isLocallyAdministered() const noexcept { return (bytes_[0] & 0x02) != 0; }

    bool operator==(const MacAddress&) const = default;

private:
    bytes_type bytes_{};
};

// parse() + toString(); empty string when text is not a MAC address.
[[nodiscard]] std::string normalizeMac(std::string_view text);

/**
 * @brief Generates QEMU-convention addresses 52:54:00:xx:yy:zz
 *
 * Octets come from raw mt19937 output rather than a distribution so a given
 * seed yields the same address with every standard library.
 */
class MacAddressGenerator {
public:
    static constexpr std::array<std::uint8_t, 3> kQemuPrefix{0x52, 0x54, 0x00};

    MacAddressGenerator();
    explicit MacAddressGenerator(std::uint32_t seed);

    // Same name, same sequence of addresses, on every run.
    [[nodiscard]] static MacAddressGenerator forName(std::string_view guestName);
    [[nodiscard]] static std::uint32_t seedFromName(std::string_view guestName);

    [[nodiscard]] MacAddress next(std::optional<std::uint8_t> lastOctet = std::nullopt);

private:
    std::mt19937 engine;
};

} // namespace NETWORK
