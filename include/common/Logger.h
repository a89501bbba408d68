#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <memory>
#include <string>

namespace thetadesk {

class Logger {
public:
    static Logger& getInstance();
    void initialize(const std::string& log_dir = "logs", const std::string& level = "info");

    template<typename... Args>
    void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) {
            main_logger_->debug(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) {
            main_logger_->info(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) {
            main_logger_->warn(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (main_logger_) {
            main_logger_->error(fmt, std::forward<Args>(args)...);
        }
    }

    // 파이프라인 최종 판단 1줄 기록 (CSV)
    void logDecision(const std::string& symbol, double iv_rank, const std::string& signal,
                     int min_dte, int max_dte, bool spread_ok);

private:
    Logger() = default;
    std::shared_ptr<spdlog::logger> main_logger_;
    std::shared_ptr<spdlog::logger> decision_logger_;
    bool initialized_ = false;
};

#define LOG_DEBUG(...) thetadesk::Logger::getInstance().debug(__VA_ARGS__)
#define LOG_INFO(...) thetadesk::Logger::getInstance().info(__VA_ARGS__)
#define LOG_WARN(...) thetadesk::Logger::getInstance().warn(__VA_ARGS__)
#define LOG_ERROR(...) thetadesk::Logger::getInstance().error(__VA_ARGS__)

} // namespace thetadesk
