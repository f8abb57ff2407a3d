#ifndef VG_LOGGER_H
#define VG_LOGGER_H

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace vg {

class Logger {
public:
    static Logger& instance() {
        static Logger inst;
        return inst;
    }

    // Sinks are fixed on first init; later calls only adjust the level.
    void init(const std::string& log_file = "voxguard.log",
              spdlog::level::level_enum level = spdlog::level::info) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (initialized_) {
            for (auto& sink : logger_->sinks()) sink->set_level(level);
            logger_->set_level(level);
            return;
        }

        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_level(level);

        std::vector<spdlog::sink_ptr> sinks{console_sink};
        std::string file_error;
        if (!log_file.empty()) {
            try {
                auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    log_file, 5 * 1024 * 1024, 3);
                file_sink->set_level(level);
                sinks.push_back(file_sink);
            } catch (const spdlog::spdlog_ex& e) {
                file_error = e.what();
            }
        }

        logger_ = std::make_shared<spdlog::logger>("voxguard", sinks.begin(), sinks.end());
        logger_->set_level(level);
        logger_->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
        logger_->flush_on(spdlog::level::warn);

        spdlog::register_logger(logger_);
        initialized_ = true;

        if (!file_error.empty())
            logger_->warn("File logging disabled ({}): {}", log_file, file_error);
    }

    std::shared_ptr<spdlog::logger> get() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (initialized_) return logger_;
        }
        init();
        std::lock_guard<std::mutex> lock(mutex_);
        return logger_;
    }

    void shutdown() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (initialized_) {
            logger_->flush();
            spdlog::drop("voxguard");
            logger_.reset();
            initialized_ = false;
        }
    }

private:
    Logger() = default;
    ~Logger() { shutdown(); }
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::shared_ptr<spdlog::logger> logger_;
    std::mutex mutex_;
    bool initialized_ = false;
};

} // namespace vg

#define VG_LOG_DEBUG(...) vg::Logger::instance().get()->debug(__VA_ARGS__)
#define VG_LOG_INFO(...)  vg::Logger::instance().get()->info(__VA_ARGS__)
#define VG_LOG_WARN(...)  vg::Logger::instance().get()->warn(__VA_ARGS__)
#define VG_LOG_ERROR(...) vg::Logger::instance().get()->error(__VA_ARGS__)

#endif // VG_LOGGER_H
