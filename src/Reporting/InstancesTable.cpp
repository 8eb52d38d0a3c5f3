#include "Reporting/InstancesTable.hpp"
#include <fmt/format.h>
#include <fstream>
#include "Utils/Exception.hpp"

namespace REPORTING {

std::string csvEscape(const std::string& field) {
    if (field.find_first_of(",\"\r\n") == std::string::npos) return field;
    std::string quoted = "\"";
    for (char c : field) {
        if (c == '"') quoted += '"';
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

std::string formatInstancesCsv(const std::vector<InstanceRow>& rows) {
    std::string csv = "NAME,IP,MAC,DISK,SEED_ISO,PID\r\n";
    for (const auto& r : rows) {
        csv += fmt::format("{},{},{},{},{},{}\r\n", csvEscape(r.name), csvEscape(r.ip), csvEscape(r.mac),
                           csvEscape(r.disk), csvEscape(r.seedIso), csvEscape(r.pid));
    }
    return csv;
}

void writeInstancesCsv(const std::filesystem::path& path, const std::vector<InstanceRow>& rows) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) throw StorageException("cannot open " + path.string());
    out << formatInstancesCsv(rows);
    out.flush();
    if (!out) throw StorageException("write failed: " + path.string());
}

std::string formatSummaryTable(const std::vector<InstanceRow>& rows) {
    std::string table = "Summary\n-------\n";
    for (const auto& r : rows) {
        table += fmt::format("{:>12}  {:>15}   pid={}", r.name, r.ip, r.pid.empty() ? "-" : r.pid);
        if (r.discovered) {
            const bool match = *r.discovered == r.ip;
            table += fmt::format("   seen={} ({})", r.discovered->empty() ? "-" : *r.discovered,
                                 r.discovered->empty() ? r.discoveryState : (match ? "ok" : "MISMATCH"));
        }
        table += '\n';
    }
    return table;
}

} // namespace REPORTING
