#pragma once

#include <optional>
#include <string_view>

#include <boost/log/trivial.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>

#define TRACE BOOST_LOG_TRIVIAL(trace)
#define DEBUG BOOST_LOG_TRIVIAL(debug)
#define INFO BOOST_LOG_TRIVIAL(info)
#define WARNING BOOST_LOG_TRIVIAL(warning)
#define ERROR BOOST_LOG_TRIVIAL(error)
#define FATAL BOOST_LOG_TRIVIAL(fatal)

namespace fieldkit {

namespace logging = boost::log;

enum class log_level : unsigned char {
    disabled,
    debug_only,
    info_only,
    warning_and_above,
    full,
};

void enable_logging();
void disable_logging();
void set_logging_level(log_level level);

/* "disabled", "debug", "info", "warning" or "full" */
std::optional<log_level> parse_log_level(std::string_view name);

/************************************************************
 * Apply the level named by the FIELDKIT_LOG_LEVEL
 * environment variable. An unset variable keeps the current
 * level, an unknown name leaves it unchanged with a warning.
 *
 * @return  The level applied, if any
 ************************************************************/
std::optional<log_level> init_logging_from_env();

}  // namespace fieldkit
