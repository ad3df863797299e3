#pragma once
#include <boost/log/trivial.hpp>
#include <string>

#include "harbor/log/log_config.hpp"

namespace harbor::log {

class Logger {
public:
    static void init(const LogConfig &config);
    static void shutdown();
    static LogConfig::LogLevel level_from_string(const std::string &level_str);
    static void set_level(LogConfig::LogLevel level);

private:
    static LogConfig config_;
};

}  // namespace harbor::log

#define HARBOR_LOG_TRACE BOOST_LOG_TRIVIAL(trace)
#define HARBOR_LOG_DEBUG BOOST_LOG_TRIVIAL(debug)
#define HARBOR_LOG_INFO BOOST_LOG_TRIVIAL(info)
#define HARBOR_LOG_WARN BOOST_LOG_TRIVIAL(warning)
#define HARBOR_LOG_ERROR BOOST_LOG_TRIVIAL(error)
#define HARBOR_LOG_FATAL BOOST_LOG_TRIVIAL(fatal)
