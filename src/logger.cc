#include "logger.hh"

#include <iostream>

Logger::Logger(std::ostream& stream, log_level level)
    : m_stream(&stream), m_level(level)
{
}

Logger::~Logger()
{
}

bool Logger::enabled(log_level level) const
{
    return static_cast<int>(level) <= static_cast<int>(m_level);
}

void Logger::set_level(log_level level)
{
    m_level = level;
}

log_level Logger::level() const
{
    return m_level;
}

void Logger::write(log_level level, const std::string& message)
{
    if (!enabled(level))
        return;

    *m_stream << "[" << log_level_name(level) << "] " << message << std::endl;
}

Logger::line::line(Logger& logger, log_level level)
    : m_logger(logger), m_level(level), m_enabled(logger.enabled(level))
{
}

Logger::line::~line()
{
    if (m_enabled)
        m_logger.write(m_level, m_stream.str());
}

Logger& Logger::null()
{
    // an ostream without a buffer discards everything
    static std::ostream discard(nullptr);
    static Logger logger(discard, log_level::error);

    return logger;
}

bool parse_log_level(const std::string& text, log_level& level)
{
    if (text == "error")
        level = log_level::error;

    else if (text == "warning")
        level = log_level::warning;

    else if (text == "info")
        level = log_level::info;

    else if (text == "debug")
        level = log_level::debug;

    else
        return false;

    return true;
}

const char* log_level_name(log_level level)
{
    switch (level)
    {
    case log_level::error:
        return "error";

    case log_level::warning:
        return "warning";

    case log_level::info:
        return "info";

    case log_level::debug:
        return "debug";
    }

    return "?";
}
