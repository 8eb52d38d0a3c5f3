#pragma once
#include <memory>
#include <mutex>
#include <string>
#include "spdlog/spdlog.h"

class SafeLogger {
public:
    struct Config {
        std::string name = "labspawn";
        // Empty disables the rotating file sink.
        std::string filePath;
        spdlog::level::level_enum consoleLevel = spdlog::level::info;
        spdlog::level::level_enum fileLevel = spdlog::level::trace;
        std::size_t rotationSize = 1024 * 1024 * 5;
        std::size_t maxFiles = 3;
    };

    // First call wins; later calls are ignored until reset().
    static void initialize(const Config& config);
    static void initialize() { initialize(Config{}); }
    static void reset();

    static std::shared_ptr<spdlog::logger>& get() {
        if (!instance) initialize();
        return instance;
    }

private:
    inline static std::shared_ptr<spdlog::logger> instance = nullptr;
    inline static std::mutex mtx;
};

#define LSLOG_TRACE(...)    SafeLogger::get()->trace(__VA_ARGS__)
#define LSLOG_DEBUG(...)    SafeLogger::get()->debug(__VA_ARGS__)
#define LSLOG_INFO(...)     SafeLogger::get()->info(__VA_ARGS__)
#define LSLOG_WARN(...)     SafeLogger::get()->warn(__VA_ARGS__)
#define LSLOG_ERROR(...)    SafeLogger::get()->error(__VA_ARGS__)
#define LSLOG_CRITICAL(...) SafeLogger::get()->critical(__VA_ARGS__)
