#pragma once
#include <boost/program_options.hpp>
#include <chrono>
#include <filesystem>
#include <iosfwd>
#include <string>

namespace po = boost::program_options;

// Options every labspawn program accepts.
struct CommonOptions {
    std::string configFile;
    std::string logFile;
    bool verbose{false};
};

void addCommonOptions(po::options_description& desc, CommonOptions& common);

/**
 * @brief Parses argv, then the INI file named by --config if any
 *
 * Values given on the command line win over the file. Prints usage and
 * returns false on --help.
 * @throws po::error for malformed or missing options, SetupException when
 *         the config file cannot be opened
 */
bool parseCommandLine(int argc, const char* const argv[], const po::options_description& desc,
                      po::variables_map& vm, std::ostream& usageOut);

// Console at info (debug with --verbose), plus a rotating file when --log-file is set.
void initLogging(const CommonOptions& common);

// Fractional seconds from the command line. Throws SetupException unless positive.
[[nodiscard]] std::chrono::milliseconds secondsToMillis(double seconds);

// Leading "~" or "~/" is replaced with $HOME.
[[nodiscard]] std::filesystem::path expandUser(const std::string& path);
