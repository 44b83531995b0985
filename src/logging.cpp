#include "logging.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <unordered_map>

namespace cosmkit {
namespace logging {

namespace {

std::mutex& registry_mutex() {
    static std::mutex mutex;
    return mutex;
}

std::unordered_map<std::string, std::unique_ptr<Logger>>& registry() {
    static std::unordered_map<std::string, std::unique_ptr<Logger>> loggers;
    return loggers;
}

std::atomic<Level>& default_level() {
    static std::atomic<Level> level{Level::INFO};
    return level;
}

std::shared_ptr<Handler> console_handler() {
    static auto handler = std::make_shared<ConsoleHandler>();
    return handler;
}

std::string current_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm_buf{};
    localtime_r(&time, &tm_buf);

    std::ostringstream ss;
    ss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    ss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return ss.str();
}

} // namespace

std::string level_name(Level level) {
    switch (level) {
    case Level::DEBUG:
        return "DEBUG";
    case Level::INFO:
        return "INFO";
    case Level::WARNING:
        return "WARNING";
    case Level::ERROR:
        return "ERROR";
    }
    return "UNKNOWN";
}

void ConsoleHandler::emit(Level level, const std::string& logger_name, const std::string& message) {
    static std::mutex output_mutex;
    std::lock_guard<std::mutex> lock(output_mutex);
    std::clog << "[" << current_timestamp() << "] [" << level_name(level) << "] ["
              << logger_name << "] " << message << std::endl;
}

LogStream::LogStream(Logger* logger, Level level) : logger_(logger), level_(level) {}

LogStream::~LogStream() {
    if (logger_) {
        logger_->log(level_, stream_.str());
    }
}

LogStream::LogStream(LogStream&& other) noexcept
    : logger_(other.logger_), level_(other.level_), stream_(std::move(other.stream_)) {
    other.logger_ = nullptr;
}

Logger::Logger(std::string name)
    : debug(this, Level::DEBUG)
    , info(this, Level::INFO)
    , warning(this, Level::WARNING)
    , error(this, Level::ERROR)
    , name_(std::move(name))
    , level_(default_level().load())
    , handlers_{console_handler()}
{}

void Logger::add_handler(std::shared_ptr<Handler> handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_.push_back(std::move(handler));
}

void Logger::clear_handlers() {
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_.clear();
}

void Logger::log(Level level, const std::string& message) {
    if (!enabled(level)) {
        return;
    }
    std::vector<std::shared_ptr<Handler>> handlers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handlers = handlers_;
    }
    for (auto& handler : handlers) {
        handler->emit(level, name_, message);
    }
}

Logger& get_logger(const std::string& name) {
    std::lock_guard<std::mutex> lock(registry_mutex());
    auto& loggers = registry();
    auto it = loggers.find(name);
    if (it == loggers.end()) {
        it = loggers.emplace(name, std::make_unique<Logger>(name)).first;
    }
    return *it->second;
}

void set_default_level(Level level) {
    default_level().store(level);
}

} // namespace logging
} // namespace cosmkit
