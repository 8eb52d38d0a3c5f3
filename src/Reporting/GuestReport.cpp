#include "Reporting/GuestReport.hpp"
#include <fmt/format.h>

namespace REPORTING {

nlohmann::ordered_json toJson(const GuestReport& report) {
    nlohmann::ordered_json j;
    j["vm"] = report.name;
    j["overlay"] = report.overlay;
    j["pidfile"] = report.pidFile;
    j["logfile"] = report.logFile;
    j["pid"] = report.pid ? nlohmann::ordered_json(std::to_string(*report.pid)) : nlohmann::ordered_json(nullptr);
    j["mac"] = report.mac;
    if (report.address) {
        const auto ip = report.address->to_string();
        j["ip"] = ip;
        j["api_url"] = fmt::format("http://{}:{}", ip, report.apiPort);
    } else {
        j["ip"] = nullptr;
        j["api_url"] = nullptr;
    }
    j["auth"] = {{"user", report.user}, {"password", report.password}};
    j["notes"] = "Consoles are on TCP 5000-5999 (UFW opened). Connect GNS3 GUI to api_url with auth.";
    return j;
}

std::string timeoutHints(const GuestReport& report) {
    return fmt::format(
        "TIP: If IP is null, the VM may still be booting. SSH is enabled; once you know the IP, "
        "`ssh {}@<IP>` (pass: {}).\n"
        "MAC: {}\n"
        "Log: {}\n",
        report.user, report.password, report.mac, report.logFile);
}

} // namespace REPORTING
