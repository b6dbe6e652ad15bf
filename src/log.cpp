#include <cstdlib>
#include <string>
#include <string_view>
#include <utility>

#include <fieldkit/util/log.hpp>

namespace fieldkit {

void enable_logging() {
    if (!logging::core::get()->get_logging_enabled())
        logging::core::get()->set_logging_enabled(true);
}

void disable_logging() {
    if (logging::core::get()->get_logging_enabled())
        logging::core::get()->set_logging_enabled(false);
}

namespace {

namespace trivial = logging::trivial;

logging::filter level_filter(log_level level) {
    using logging::trivial::severity;
    switch (level) {
    case log_level::debug_only:        return severity == trivial::debug;
    case log_level::info_only:         return severity == trivial::info;
    case log_level::warning_and_above: return severity >= trivial::warning;
    default:                           return severity >= trivial::trace;
    }
}

constexpr std::pair<std::string_view, log_level> level_names[] = {
    { "disabled", log_level::disabled },
    { "debug",    log_level::debug_only },
    { "info",     log_level::info_only },
    { "warning",  log_level::warning_and_above },
    { "full",     log_level::full },
};

}  // namespace

void set_logging_level(log_level level) {
    if (level == log_level::disabled) {
        disable_logging();
        return;
    }
    enable_logging();
    logging::core::get()->set_filter(level_filter(level));
}

std::optional<log_level> parse_log_level(std::string_view name) {
    for (const auto& [key, level] : level_names) {
        if (key == name)
            return level;
    }
    return std::nullopt;
}

std::optional<log_level> init_logging_from_env() {
    const char *env = std::getenv("FIELDKIT_LOG_LEVEL");
    if (env == nullptr)
        return std::nullopt;

    auto level = parse_log_level(env);
    if (!level) {
        WARNING << "Unknown FIELDKIT_LOG_LEVEL \"" << env << "\"";
        return std::nullopt;
    }
    set_logging_level(*level);
    return level;
}

}  // namespace fieldkit
