#pragma once

#include <chrono>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <memory>
#include <spdlog/async.h>
#include <spdlog/async_logger.h>
#include <spdlog/details/thread_pool.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string>
#include <system_error>
#include <unistd.h>

namespace bucketpull {

struct LoggerOptions {
    spdlog::level::level_enum level = spdlog::level::info;
    // stdout belongs to the progress display, so the console sink writes to
    // stderr and normally only lets warnings through
    spdlog::level::level_enum console_level = spdlog::level::warn;
    std::filesystem::path file;
    std::size_t queue_size = 8192;
};

// Installs an async spdlog logger as the default for the lifetime of the
// object: a daily file under LoggerOptions::file plus a coloured stderr sink.
class Logger {
public:
    using Level = spdlog::level::level_enum;

    explicit Logger(const LoggerOptions& options) {
        std::error_code ec;
        std::filesystem::create_directories(options.file.parent_path(), ec);

        spdlog::file_event_handlers handlers;
        handlers.after_open = [](const spdlog::filename_t&, std::FILE* fstream) {
            if (fstream) {
                auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
                std::fprintf(fstream, "---- bucketpull pid %d, %s", static_cast<int>(::getpid()),
                             std::ctime(&now));
            }
        };
        file_sink_ = std::make_shared<spdlog::sinks::daily_file_sink_mt>(options.file.string(),
                                                                          0,
                                                                          0,
                                                                          false,
                                                                          7,
                                                                          handlers);
        console_sink_ = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink_->set_level(options.console_level);
        console_sink_->set_pattern("%^[%l]%$ %v");
        file_sink_->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [t%t] %v");

        // workers must never stall on a full log queue mid-transfer
        thread_pool_ = std::make_shared<spdlog::details::thread_pool>(options.queue_size, 1);
        logger_ = std::make_shared<spdlog::async_logger>(
            "bucketpull",
            spdlog::sinks_init_list{file_sink_, console_sink_},
            thread_pool_,
            spdlog::async_overflow_policy::overrun_oldest);
        logger_->set_level(options.level);
        logger_->flush_on(spdlog::level::warn);
        logger_->set_error_handler(
            [](const std::string& msg) { std::fprintf(stderr, "log error: %s\n", msg.c_str()); });
        spdlog::set_default_logger(logger_);
    }
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    ~Logger() { spdlog::shutdown(); }

    [[nodiscard]] Level level() const { return logger_->level(); }
    [[nodiscard]] Level consoleLevel() const { return console_sink_->level(); }

private:
    std::shared_ptr<spdlog::details::thread_pool> thread_pool_;
    std::shared_ptr<spdlog::sinks::daily_file_sink_mt> file_sink_;
    std::shared_ptr<spdlog::sinks::stderr_color_sink_mt> console_sink_;
    std::shared_ptr<spdlog::async_logger> logger_;
};

} // namespace bucketpull
