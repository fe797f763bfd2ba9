#ifndef LOGGER_HH
# define LOGGER_HH

# include <ostream>
# include <sstream>
# include <string>

enum class log_level
{
    error = 0,
    warning = 1,
    info = 2,
    debug = 3
};

// Diagnostics sink handed to the loader. Messages above the configured
// level are dropped.
class Logger
{
public:
    Logger(std::ostream& stream, log_level level);
    virtual ~Logger();

    bool enabled(log_level level) const;
    void set_level(log_level level);
    log_level level() const;

    virtual void write(log_level level, const std::string& message);

    // Logger::line(logger, log_level::debug) << "x = " << x;
    // The message is written when the temporary is destroyed.
    class line
    {
    public:
        line(Logger& logger, log_level level);
        ~line();

        template <typename T>
        line& operator<<(const T& value)
        {
            if (m_enabled)
                m_stream << value;
            return *this;
        }

    private:
        Logger& m_logger;
        log_level m_level;
        bool m_enabled;
        std::ostringstream m_stream;
    };

    // logger writing nowhere, used when the caller gives none
    static Logger& null();

private:
    std::ostream* m_stream;
    log_level m_level;
};

// "error", "warning", "info" or "debug"; returns false on anything else
bool parse_log_level(const std::string& text, log_level& level);

const char* log_level_name(log_level level);

#endif /* !LOGGER_HH */
