#include "Logger.hpp"
#include <vector>
#include "util/FileUtils.hpp"

namespace mc {

std::shared_ptr<spdlog::logger> Logger::logger_;
std::filesystem::path Logger::logFile_;

namespace {

constexpr std::size_t kMaxLogBytes = 5 * 1024 * 1024;
constexpr std::size_t kMaxLogFiles = 3;

spdlog::level::level_enum levelFor(bool debug) {
    return debug ? spdlog::level::debug : spdlog::level::info;
}

} // namespace

void Logger::init(std::string_view appName, bool debug) {
    const std::string name(appName);
    spdlog::drop(name);
    logFile_.clear();

    std::vector<spdlog::sink_ptr> sinks;
    auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console->set_pattern("%^[%H:%M:%S.%e] [%l]%$ %v");
    sinks.push_back(console);

    std::string fileError;
    auto logDir = file::cacheDir() / "logs";
    if (file::ensureDir(logDir)) {
        auto path = logDir / (name + ".log");
        try {
            auto rotating = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    path.string(), kMaxLogBytes, kMaxLogFiles);
            rotating->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] [%s:%#] %v");
            sinks.push_back(rotating);
            logFile_ = path;
        } catch (const spdlog::spdlog_ex& ex) {
            fileError = ex.what();
        }
    } else {
        fileError = "cannot create " + logDir.string();
    }

    logger_ = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger_->set_level(levelFor(debug));
    logger_->flush_on(spdlog::level::warn);
    spdlog::register_logger(logger_);
    spdlog::set_default_logger(logger_);

    if (!fileError.empty()) {
        LOG_WARN("Logging to console only: {}", fileError);
    } else {
        LOG_DEBUG("Log file: {}", logFile_.string());
    }
}

void Logger::setDebug(bool debug) {
    get()->set_level(levelFor(debug));
    LOG_DEBUG("Debug logging enabled");
}

void Logger::shutdown() {
    if (logger_)
        logger_->flush();
    logger_.reset();
    logFile_.clear();
    spdlog::shutdown();
}

std::shared_ptr<spdlog::logger>& Logger::get() {
    if (!logger_)
        init();
    return logger_;
}

} // namespace mc
