#ifndef GISTVAULT_LOGGER_HPP
#define GISTVAULT_LOGGER_HPP

#include <string>
#include <boost/log/trivial.hpp>
#include "config/config.hpp"

namespace gistvault::logging {

// Replaces all sinks with a text file sink, plus a console sink when
// config.console is set, and filters below config.level
void init_logging(const config::LoggingConfig& config);

// Minimum severity that reaches the sinks
void set_log_level(boost::log::trivial::severity_level level);

void enable_logging();
void disable_logging();

// Flushes and detaches every sink
void shutdown_logging();

} // namespace gistvault::logging

#endif // GISTVAULT_LOGGER_HPP
