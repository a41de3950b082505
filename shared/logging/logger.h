#ifndef SCANLINK_LOGGER_H
#define SCANLINK_LOGGER_H

#include <functional>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace scanlink
{
    namespace logging
    {

        enum class LogLevel
        {
            DEBUG = 0,
            INFO = 1,
            WARNING = 2,
            ERROR = 3,
            CRITICAL = 4
        };

        /**
         * Key=value pairs appended to a log line, e.g. device_id=... task_id=...
         */
        class LogContext
        {
        public:
            LogContext() = default;

            template <typename T>
            LogContext &add(const std::string &key, const T &value)
            {
                std::ostringstream ss;
                ss << value;
                fields_.emplace_back(key, ss.str());
                return *this;
            }

            std::string format() const;
            bool empty() const { return fields_.empty(); }

        private:
            // Insertion order is kept so device_id stays first on every line
            std::vector<std::pair<std::string, std::string>> fields_;
        };

        /**
         * Receives every formatted line in addition to console/file output.
         * Used by tests to assert on emitted messages.
         */
        using LogSink = std::function<void(LogLevel, const std::string &)>;

        /**
         * Named, thread-safe logger
         */
        class Logger
        {
        public:
            Logger(const std::string &name, LogLevel level = LogLevel::INFO);
            ~Logger();

            void set_level(LogLevel level) { level_ = level; }
            void set_output_file(const std::string &filename);
            void set_console_output(bool enabled) { console_output_ = enabled; }
            void set_sink(LogSink sink);

            void debug(const std::string &message, const LogContext &context = LogContext{});
            void info(const std::string &message, const LogContext &context = LogContext{});
            void warning(const std::string &message, const LogContext &context = LogContext{});
            void error(const std::string &message, const LogContext &context = LogContext{});
            void critical(const std::string &message, const LogContext &context = LogContext{});

            bool is_enabled(LogLevel level) const { return level >= level_; }
            const std::string &name() const { return name_; }

        private:
            void log(LogLevel level, const std::string &message, const LogContext &context);
            std::string format_line(LogLevel level, const std::string &message, const LogContext &context) const;

            std::string name_;
            LogLevel level_;
            bool console_output_;
            std::unique_ptr<std::ofstream> file_output_;
            LogSink sink_;
            mutable std::mutex mutex_;
        };

        /**
         * Process-wide registry of named loggers
         */
        class LoggerManager
        {
        public:
            static LoggerManager &instance();

            void setup_logging(LogLevel level = LogLevel::INFO,
                               const std::string &log_file = "",
                               bool console_output = true);

            /** Installs a sink on every current and future logger */
            void set_sink(LogSink sink);

            std::shared_ptr<Logger> get_logger(const std::string &name);

            static LogLevel string_to_level(const std::string &level_str);
            static const char *level_to_string(LogLevel level);

        private:
            LoggerManager() = default;

            LogLevel default_level_ = LogLevel::INFO;
            std::string default_log_file_;
            bool default_console_output_ = true;
            LogSink default_sink_;
            std::map<std::string, std::shared_ptr<Logger>> loggers_;
            std::mutex mutex_;
        };

        std::shared_ptr<Logger> get_logger(const std::string &name);
        void setup_logging(LogLevel level = LogLevel::INFO,
                           const std::string &log_file = "",
                           bool console_output = true);

    } // namespace logging
} // namespace scanlink

#endif // SCANLINK_LOGGER_H
