#include "harbor/log/logger.hpp"

#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>
#include <boost/log/utility/setup/formatter_parser.hpp>
#include <filesystem>
#include <iostream>

namespace logging = boost::log;
namespace sinks = boost::log::sinks;

namespace harbor::log {

LogConfig Logger::config_;

namespace {

void replace_all(std::string& pattern, const std::string& from,
                 const std::string& to) {
    for (size_t pos = 0; (pos = pattern.find(from, pos)) != std::string::npos;) {
        pattern.replace(pos, from.size(), to);
        pos += to.size();
    }
}

std::string normalize_formatter_pattern(std::string pattern) {
    // Boost.Log named placeholders are used as-is.
    if (pattern.find("%TimeStamp%") != std::string::npos ||
        pattern.find("%Message%") != std::string::npos ||
        pattern.find("%Severity%") != std::string::npos ||
        pattern.find("%ThreadID%") != std::string::npos) {
        return pattern;
    }

    // Translate spdlog-style patterns such as
    // "[%Y-%m-%d %H:%M:%S.%f] [%t] [%l] %v".
    auto left = pattern.find("[%");
    if (left != std::string::npos) {
        auto right = pattern.find("]", left);
        if (right != std::string::npos &&
            pattern.substr(left, right - left).find("%Y") !=
                std::string::npos) {
            pattern.replace(left, right - left + 1, "[%TimeStamp%]");
        }
    }
    replace_all(pattern, "%t", "%ThreadID%");
    replace_all(pattern, "%l", "%Severity%");
    replace_all(pattern, "%v", "%Message%");
    return pattern;
}

logging::trivial::severity_level to_boost_level(LogConfig::LogLevel level) {
    switch (level) {
        case LogConfig::LogLevel::TRACE:
            return logging::trivial::trace;
        case LogConfig::LogLevel::DEBUG:
            return logging::trivial::debug;
        case LogConfig::LogLevel::INFO:
            return logging::trivial::info;
        case LogConfig::LogLevel::WARN:
            return logging::trivial::warning;
        case LogConfig::LogLevel::ERROR:
            return logging::trivial::error;
        case LogConfig::LogLevel::FATAL:
            return logging::trivial::fatal;
    }
    return logging::trivial::info;
}

}  // namespace

void Logger::init(const LogConfig& config) {
    config_ = config;

    // Severity is an enum, so the formatter parser needs to be told how to
    // print it.
    logging::register_simple_formatter_factory<logging::trivial::severity_level,
                                               char>("Severity");

    if (config.file.enabled) {
        std::filesystem::path log_path(config.file.log_file);
        auto parent_path = log_path.parent_path();
        if (!parent_path.empty()) {
            std::filesystem::create_directories(parent_path);
        }

        logging::add_file_log(
            logging::keywords::file_name = config.file.log_file,
            logging::keywords::rotation_size = config.file.max_file_size,
            logging::keywords::time_based_rotation =
                sinks::file::rotation_at_time_point(0, 0, 0),
            logging::keywords::max_files = config.file.max_files,
            logging::keywords::auto_flush = true,
            logging::keywords::format = logging::parse_formatter(
                normalize_formatter_pattern(config.file.pattern)));
    }

    if (config.console.enabled) {
        logging::add_console_log(
            std::clog,
            logging::keywords::format = logging::parse_formatter(
                normalize_formatter_pattern(config.console.pattern)));
    }

    logging::add_common_attributes();
    set_level(config.global_level);

    BOOST_LOG_TRIVIAL(info) << "Logger initialized successfully";
}

void Logger::shutdown() {
    BOOST_LOG_TRIVIAL(info) << "Logger shutting down";
    logging::core::get()->flush();
    logging::core::get()->remove_all_sinks();
}

LogConfig::LogLevel Logger::level_from_string(const std::string& level_str) {
    return LogConfig::level_from_string(level_str);
}

void Logger::set_level(LogConfig::LogLevel level) {
    config_.global_level = level;
    logging::core::get()->set_filter(
        logging::expressions::attr<logging::trivial::severity_level>(
            "Severity") >= to_boost_level(level));
}

}  // namespace harbor::log
