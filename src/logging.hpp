#pragma once

#include <memory>
#include <mutex>
#include <atomic>
#include <sstream>
#include <string>
#include <vector>

namespace cosmkit {
namespace logging {

enum class Level { DEBUG = 0, INFO = 1, WARNING = 2, ERROR = 3 };

std::string level_name(Level level);

class Handler {
public:
    virtual ~Handler() = default;
    virtual void emit(Level level, const std::string& logger_name, const std::string& message) = 0;
};

// Writes "[time] [LEVEL] [name] message" lines to std::clog
class ConsoleHandler : public Handler {
public:
    void emit(Level level, const std::string& logger_name, const std::string& message) override;
};

class Logger;

// Collects one message and hands it to the logger when destroyed
class LogStream {
public:
    LogStream(Logger* logger, Level level);
    ~LogStream();

    LogStream(const LogStream&) = delete;
    LogStream& operator=(const LogStream&) = delete;
    LogStream(LogStream&& other) noexcept;

    template <typename T> LogStream& operator<<(const T& value) {
        if (logger_) {
            stream_ << value;
        }
        return *this;
    }

private:
    Logger* logger_;
    Level level_;
    std::ostringstream stream_;
};

class LogProxy {
public:
    LogProxy(Logger* logger, Level level) : logger_(logger), level_(level) {}

    template <typename T> LogStream operator<<(const T& value);

private:
    Logger* logger_;
    Level level_;
};

// Named logger. Messages below the logger's level are dropped before they
// are formatted. Obtain instances through get_logger().
class Logger {
public:
    explicit Logger(std::string name);

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    LogProxy debug;
    LogProxy info;
    LogProxy warning;
    LogProxy error;

    void set_level(Level level) { level_.store(level); }
    Level level() const { return level_.load(); }
    bool enabled(Level level) const { return level >= level_.load(); }

    void add_handler(std::shared_ptr<Handler> handler);
    void clear_handlers();

    const std::string& name() const { return name_; }

    void log(Level level, const std::string& message);

private:
    std::string name_;
    std::atomic<Level> level_;
    std::mutex mutex_;
    std::vector<std::shared_ptr<Handler>> handlers_;
};

template <typename T> LogStream LogProxy::operator<<(const T& value) {
    LogStream stream(logger_ && logger_->enabled(level_) ? logger_ : nullptr, level_);
    stream << value;
    return stream;
}

// Process-wide registry; the same name always yields the same logger
Logger& get_logger(const std::string& name);

// Level given to loggers created from now on
void set_default_level(Level level);

} // namespace logging
} // namespace cosmkit
