#include "System/Logger.hpp"
#include <vector>
#include "spdlog/sinks/rotating_file_sink.h"
#include "spdlog/sinks/stdout_color_sinks.h"

void SafeLogger::initialize(const Config& config) {
    std::lock_guard lock(mtx);
    if (instance) return;

    // stdout carries program results, so the console sink writes to stderr.
    std::vector<spdlog::sink_ptr> sinks;
    auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console->set_level(config.consoleLevel);
    sinks.push_back(console);

    std::string fileError;
    if (!config.filePath.empty()) {
        try {
            auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.filePath, config.rotationSize, config.maxFiles);
            file->set_level(config.fileLevel);
            sinks.push_back(file);
        } catch (const spdlog::spdlog_ex& e) {
            fileError = e.what();
        }
    }

    instance = std::make_shared<spdlog::logger>(config.name, sinks.begin(), sinks.end());
    instance->set_level(spdlog::level::trace);
    instance->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    instance->flush_on(spdlog::level::info);
    spdlog::set_default_logger(instance);
    if (!fileError.empty()) instance->warn("file logging disabled: {}", fileError);
}

void SafeLogger::reset() {
    std::lock_guard lock(mtx);
    instance.reset();
}
