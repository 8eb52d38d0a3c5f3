#include "Discovery/HostNetworkResolver.hpp"
#include <sstream>
#include "System/Logger.hpp"

namespace DISCOVERY {

namespace {

std::optional<std::string> firstLine(const std::string& text) {
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        const auto b = line.find_first_not_of(" \t\r");
        if (b == std::string::npos) continue;
        const auto e = line.find_last_not_of(" \t\r");
        return line.substr(b, e - b + 1);
    }
    return std::nullopt;
}

} // namespace

HostNetworkContext IHostNetworkResolver::resolve(const std::string& ifname) {
    HostNetworkContext ctx;
    const InterfaceAddress raw = query(ifname);
    if (!raw.address) {
        LSLOG_DEBUG("no IPv4 address on {}", ifname);
        return ctx;
    }
    auto self = NETWORK::parseIpv4(*raw.address);
    if (!self) {
        LSLOG_DEBUG("unparseable address '{}' on {}", *raw.address, ifname);
        return ctx;
    }
    ctx.selfAddress = *self;
    if (raw.mask) {
        ctx.subnet = NETWORK::cidrFromAddressAndMask(*self, *raw.mask);
        LSLOG_DEBUG("{}: {} in {}", ifname, self->to_string(), ctx.subnet->to_string());
    }
    return ctx;
}

SystemHostNetworkResolver::SystemHostNetworkResolver(std::shared_ptr<ICommandRunner> runner)
    : runner(std::move(runner)) {}

InterfaceAddress SystemHostNetworkResolver::query(const std::string& ifname) {
    if (auto viaIp = queryIproute(ifname)) return *viaIp;
    return queryIpconfig(ifname);
}

std::optional<InterfaceAddress> SystemHostNetworkResolver::queryIproute(const std::string& ifname) {
    if (!runner->exists("ip")) return std::nullopt;
    const auto res = runner->run("ip", {"-o", "-4", "addr", "show", "dev", ifname}).unwrapOr({});
    if (!res.ok()) return std::nullopt;
    return parseIprouteAddress(res.out);
}

InterfaceAddress SystemHostNetworkResolver::queryIpconfig(const std::string& ifname) {
    InterfaceAddress result;
    if (!runner->exists("ipconfig")) return result;

    const auto addr = runner->run("ipconfig", {"getifaddr", ifname}).unwrapOr({});
    if (addr.ok()) result.address = firstLine(addr.out);

    const auto mask = runner->run("ipconfig", {"getoption", ifname, "subnet_mask"}).unwrapOr({});
    if (mask.ok()) result.mask = firstLine(mask.out);
    return result;
}

std::optional<InterfaceAddress> parseIprouteAddress(std::string_view output) {
    // 2: eth0    inet 192.168.1.20/24 brd 192.168.1.255 scope global eth0\ ...
    std::istringstream in{std::string(output)};
    std::string token;
    while (in >> token) {
        if (token != "inet") continue;
        std::string cidr;
        if (!(in >> cidr)) break;
        InterfaceAddress result;
        const auto slash = cidr.find('/');
        if (slash == std::string::npos) {
            result.address = cidr;
        } else {
            result.address = cidr.substr(0, slash);
            result.mask = cidr.substr(slash + 1);
        }
        return result;
    }
    return std::nullopt;
}

std::optional<NETWORK::Ipv4Address> queryDefaultGateway(ICommandRunner& runner) {
    if (runner.exists("ip")) {
        const auto res = runner.run("ip", {"route", "show", "default"}).unwrapOr({});
        if (res.ok()) {
            // default via 10.0.0.1 dev eth0 proto dhcp ...
            std::istringstream in(res.out);
            std::string token;
            while (in >> token) {
                if (token == "via" && in >> token) return NETWORK::parseIpv4(token);
            }
        }
    }
    if (runner.exists("route")) {
        const auto res = runner.run("route", {"-n", "get", "default"}).unwrapOr({});
        if (res.ok()) {
            std::istringstream in(res.out);
            std::string token;
            while (in >> token) {
                if (token == "gateway:" && in >> token) return NETWORK::parseIpv4(token);
            }
        }
    }
    return std::nullopt;
}

} // namespace DISCOVERY
