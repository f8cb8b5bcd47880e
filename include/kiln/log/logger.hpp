#pragma once
#include <boost/log/trivial.hpp>
#include <string>

#include "kiln/log/log_config.hpp"

namespace kiln::log {

class Logger {
public:
    static void init(const LogConfig &config);
    static void shutdown();
    static void set_level(LogConfig::LogLevel level);
    static LogConfig::LogLevel level() { return config_.global_level; }

private:
    static LogConfig config_;
};

}  // namespace kiln::log

#define KILN_LOG_TRACE BOOST_LOG_TRIVIAL(trace)
#define KILN_LOG_DEBUG BOOST_LOG_TRIVIAL(debug)
#define KILN_LOG_INFO BOOST_LOG_TRIVIAL(info)
#define KILN_LOG_WARN BOOST_LOG_TRIVIAL(warning)
#define KILN_LOG_ERROR BOOST_LOG_TRIVIAL(error)
#define KILN_LOG_FATAL BOOST_LOG_TRIVIAL(fatal)
