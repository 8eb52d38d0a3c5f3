#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace REPORTING {

struct InstanceRow {
    std::string name;
    std::string ip;          // assigned address
    std::string mac;
    std::string disk;
    std::string seedIso;
    std::string pid;         // empty when unknown
    std::optional<std::string> discovered;  // set only when discovery ran
    std::string discoveryState;
};

// NAME,IP,MAC,DISK,SEED_ISO,PID with a header line; fields quoted when needed.
[[nodiscard]] std::string formatInstancesCsv(const std::vector<InstanceRow>& rows);

// Throws StorageException if the file cannot be written.
void writeInstancesCsv(const std::filesystem::path& path, const std::vector<InstanceRow>& rows);

// Aligned human readable table for stdout.
[[nodiscard]] std::string formatSummaryTable(const std::vector<InstanceRow>& rows);

[[nodiscard]] std::string csvEscape(const std::string& field);

} // namespace REPORTING
