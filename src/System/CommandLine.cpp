#include "System/CommandLine.hpp"
#include <cstdlib>
#include <fstream>
#include <ostream>
#include "System/Logger.hpp"
#include "Utils/Exception.hpp"

void addCommonOptions(po::options_description& desc, CommonOptions& common) {
    desc.add_options()
        ("help,h", "show this help")
        ("config", po::value<std::string>(&common.configFile), "INI file with defaults for any option")
        ("log-file", po::value<std::string>(&common.logFile), "also log to this file (rotated)")
        ("verbose,v", po::bool_switch(&common.verbose), "debug logging");
}

bool parseCommandLine(int argc, const char* const argv[], const po::options_description& desc,
                      po::variables_map& vm, std::ostream& usageOut) {
    po::store(po::parse_command_line(argc, argv, desc), vm);

    if (vm.count("help")) {
        usageOut << desc << "\n";
        return false;
    }

    if (vm.count("config")) {
        const auto path = vm["config"].as<std::string>();
        std::ifstream in(path);
        if (!in) throw SetupException("cannot open config file " + path);
        po::store(po::parse_config_file(in, desc), vm);
    }

    po::notify(vm);
    return true;
}

void initLogging(const CommonOptions& common) {
    SafeLogger::Config config;
    config.filePath = common.logFile;
    if (common.verbose) config.consoleLevel = spdlog::level::debug;
    SafeLogger::initialize(config);
}

std::chrono::milliseconds secondsToMillis(double seconds) {
    if (seconds <= 0) throw SetupException("intervals must be positive");
    return std::chrono::milliseconds(static_cast<long long>(seconds * 1000.0));
}

std::filesystem::path expandUser(const std::string& path) {
    if (path == "~" || path.starts_with("~/")) {
        const char* home = std::getenv("HOME");
        if (home && *home) {
            return std::filesystem::path(home) / path.substr(path.size() > 1 ? 2 : 1);
        }
    }
    return path;
}
