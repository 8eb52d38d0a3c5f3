#include "Discovery/NeighborTable.hpp"
#include <fstream>
#include <sstream>
#include "System/Logger.hpp"

namespace DISCOVERY {

SystemNeighborTable::SystemNeighborTable(std::shared_ptr<ICommandRunner> runner, std::string procPath)
    : runner(std::move(runner)), procPath(std::move(procPath)) {}

std::optional<NETWORK::Ipv4Address> SystemNeighborTable::lookup(const NETWORK::MacAddress& mac) {
    return findAddressByMac(snapshot(), mac);
}

std::string SystemNeighborTable::snapshot() {
    if (runner->exists("ip")) {
        const auto res = runner->run("ip", {"-4", "neigh", "show"}).unwrapOr({});
        if (res.ok() && !res.out.empty()) return res.out;
    }
    if (runner->exists("arp")) {
        const auto res = runner->run("arp", {"-an"}).unwrapOr({});
        if (res.ok() && !res.out.empty()) return res.out;
    }
    std::ifstream proc(procPath);
    if (proc) {
        std::ostringstream ss;
        ss << proc.rdbuf();
        return ss.str();
    }
    LSLOG_TRACE("neighbor table unavailable");
    return {};
}

std::optional<NeighborEntry> parseNeighborLine(std::string_view line) {
    std::optional<NETWORK::Ipv4Address> address;
    std::optional<NETWORK::MacAddress> mac;

    std::istringstream in{std::string(line)};
    std::string token;
    while (in >> token) {
        if (!address) {
            std::string_view candidate = token;
            if (candidate.size() > 2 && candidate.front() == '(' && candidate.back() == ')') {
                candidate = candidate.substr(1, candidate.size() - 2);
            }
            if (candidate.find('.') != std::string_view::npos) {
                address = NETWORK::parseIpv4(candidate);
                if (address) continue;
            }
        }
        if (!mac && token.find(':') != std::string::npos) {
            mac = NETWORK::MacAddress::parse(token);
        }
    }
    // Incomplete entries report 00:00:00:00:00:00 in /proc/net/arp.
    if (!address || !mac || *mac == NETWORK::MacAddress{}) return std::nullopt;
    return NeighborEntry{*address, *mac};
}

std::optional<NETWORK::Ipv4Address> findAddressByMac(std::string_view table,
                                                     const NETWORK::MacAddress& mac) {
    std::size_t pos = 0;
    while (pos < table.size()) {
        auto end = table.find('\n', pos);
        if (end == std::string_view::npos) end = table.size();
        auto entry = parseNeighborLine(table.substr(pos, end - pos));
        if (entry && entry->mac == mac) return entry->address;
        pos = end + 1;
    }
    return std::nullopt;
}

} // namespace DISCOVERY
