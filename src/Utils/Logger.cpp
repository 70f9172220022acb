// src/Utils/Logger.cpp
#include <DriverFetch/Utils/Logger.hpp>
#include <iostream> // Used before any sink exists

namespace DriverFetch {
namespace Utils {

    std::shared_ptr<spdlog::logger> Logger::s_CoreLogger;
    std::vector<spdlog::sink_ptr> Logger::s_GlobalSinks;

    void Logger::Init(const std::filesystem::path& logDir,
                      const std::string& logFileName,
                      spdlog::level::level_enum consoleLevel,
                      spdlog::level::level_enum fileLevel) {
        try {
            s_GlobalSinks.clear();

            auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            console_sink->set_level(consoleLevel);
            console_sink->set_pattern("%^[%H:%M:%S.%e] [%n] [%l] %v%$");
            s_GlobalSinks.push_back(console_sink);

            if (!logDir.empty() && !logFileName.empty()) {
                if (!std::filesystem::exists(logDir)) {
                    std::filesystem::create_directories(logDir);
                }
                std::filesystem::path logFilePath = logDir / logFileName;
                auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(logFilePath.string(), 1024 * 1024 * 5, 3);
                file_sink->set_level(fileLevel);
                file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%t] [%l] %v");
                s_GlobalSinks.push_back(file_sink);
            }

            // Loggers handed out earlier keep working but pick up the new sinks.
            spdlog::apply_all([](const std::shared_ptr<spdlog::logger>& existing) {
                existing->sinks() = s_GlobalSinks;
            });

            s_CoreLogger = spdlog::get("Core");
            if (!s_CoreLogger) {
                s_CoreLogger = std::make_shared<spdlog::logger>("Core", s_GlobalSinks.begin(), s_GlobalSinks.end());
                spdlog::register_logger(s_CoreLogger);
            }
            s_CoreLogger->set_level(spdlog::level::trace);
            s_CoreLogger->flush_on(spdlog::level::info);

            s_CoreLogger->debug("Logger initialized. Console level: {}, File level: {}",
                                spdlog::level::to_string_view(consoleLevel),
                                spdlog::level::to_string_view(fileLevel));

        } catch (const spdlog::spdlog_ex& ex) {
            std::cerr << "Log initialization failed: " << ex.what() << std::endl;
            s_CoreLogger = spdlog::stderr_color_mt("Core_Fallback");
            s_CoreLogger->set_level(spdlog::level::warn);
            s_CoreLogger->error("LOGGER INITIALIZATION FAILED. USING FALLBACK CONSOLE LOGGER.");
        } catch (const std::filesystem::filesystem_error& ex) {
            std::cerr << "Log directory setup failed: " << ex.what() << std::endl;
            Init("", "", consoleLevel, fileLevel);
        }
    }

    std::shared_ptr<spdlog::logger>& Logger::GetCoreLogger() {
        if (!s_CoreLogger) {
            Init("", "", spdlog::level::warn, spdlog::level::trace);
        }
        return s_CoreLogger;
    }

    std::shared_ptr<spdlog::logger> Logger::GetOrCreateLogger(const std::string& name) {
        if (s_GlobalSinks.empty()) {
            Init("", "", spdlog::level::warn, spdlog::level::trace);
        }
        auto logger = spdlog::get(name);
        if (!logger) {
            logger = std::make_shared<spdlog::logger>(name, s_GlobalSinks.begin(), s_GlobalSinks.end());
            logger->set_level(spdlog::level::trace); // sinks filter
            logger->flush_on(spdlog::level::info);
            try {
                spdlog::register_logger(logger);
            } catch (const spdlog::spdlog_ex&) {
                // Another thread registered the same name first.
                logger = spdlog::get(name);
            }
        }
        return logger;
    }

} // namespace Utils
} // namespace DriverFetch
