// include/DriverFetch/Utils/Logger.hpp
#ifndef LOGGER_UTIL_HPP
#define LOGGER_UTIL_HPP

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <memory>
#include <vector>
#include <filesystem>
#include <string>

namespace DriverFetch::Utils {

    class Logger {
    public:
        // Call once at startup. An empty logDir or logFileName disables the file sink.
        static void Init(const std::filesystem::path &logDir = "./logs",
                         const std::string &logFileName = "driverfetch.log",
                         spdlog::level::level_enum consoleLevel = spdlog::level::info,
                         spdlog::level::level_enum fileLevel = spdlog::level::trace);

        // Logger used by free functions and main()
        static std::shared_ptr<spdlog::logger> &GetCoreLogger();

        // Named loggers share the sinks created by Init(). Calling this before Init()
        // falls back to a console-only setup at warn level.
        static std::shared_ptr<spdlog::logger> GetOrCreateLogger(const std::string &name);

    private:
        static std::vector<spdlog::sink_ptr> s_GlobalSinks;
        static std::shared_ptr<spdlog::logger> s_CoreLogger;
    };

} // namespace DriverFetch::Utils

#define CORE_LOG_TRACE(...)    if(auto& logger = ::DriverFetch::Utils::Logger::GetCoreLogger(); logger) { logger->trace(__VA_ARGS__); }
#define CORE_LOG_DEBUG(...)    if(auto& logger = ::DriverFetch::Utils::Logger::GetCoreLogger(); logger) { logger->debug(__VA_ARGS__); }
#define CORE_LOG_INFO(...)     if(auto& logger = ::DriverFetch::Utils::Logger::GetCoreLogger(); logger) { logger->info(__VA_ARGS__); }
#define CORE_LOG_WARN(...)     if(auto& logger = ::DriverFetch::Utils::Logger::GetCoreLogger(); logger) { logger->warn(__VA_ARGS__); }
#define CORE_LOG_ERROR(...)    if(auto& logger = ::DriverFetch::Utils::Logger::GetCoreLogger(); logger) { logger->error(__VA_ARGS__); }
#define CORE_LOG_CRITICAL(...) if(auto& logger = ::DriverFetch::Utils::Logger::GetCoreLogger(); logger) { logger->critical(__VA_ARGS__); }

#endif // LOGGER_UTIL_HPP
