#ifndef STARFALL_LOGGER_HPP
#define STARFALL_LOGGER_HPP
#include <cstdlib>
#include <filesystem>
#include <source_location>
#include <spdlog/logger.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string_view>

namespace starfall {

/**
 * @brief Process-wide spdlog logger writing to the console and STARFALL_LOG_FILE
 *
 * Every line is prefixed with the call site (or a fixed tag). Debug builds show
 * everything on the console, release builds only warnings and above; the file
 * always gets trace. STARFALL_LOG_LEVEL (e.g. "info") overrides the console level.
 */
class Logger : public spdlog::logger
{
public:
    static Logger& instance(std::source_location loc = std::source_location::current())
    {
        auto& logger = shared();
        auto file = std::filesystem::path(loc.file_name()).filename().string();
        logger.set_pattern(pattern_for(fmt::format("[{}:{}]", file, loc.line())));
        return logger;
    }

    /**
     * @brief Same as instance() but tags lines with a fixed label instead of a source location
     */
    static Logger& tagged(std::string_view tag)
    {
        auto& logger = shared();
        logger.set_pattern(pattern_for(fmt::format("[{}]", tag)));
        return logger;
    }

private:
    Logger()
        : logger("Starfall")
        , m_console(std::make_shared<spdlog::sinks::stdout_color_sink_mt>())
        , m_file(std::make_shared<spdlog::sinks::basic_file_sink_mt>(STARFALL_LOG_FILE, true))
    {
#ifndef NDEBUG
        m_console->set_level(spdlog::level::trace);
#else
        m_console->set_level(spdlog::level::warn);
#endif
        if (const char* level = std::getenv("STARFALL_LOG_LEVEL")) {
            m_console->set_level(spdlog::level::from_str(level));
        }
        m_file->set_level(spdlog::level::trace);
        set_level(spdlog::level::trace);

        sinks().push_back(m_console);
        sinks().push_back(m_file);
    }

    static Logger& shared()
    {
        static Logger logger;
        return logger;
    }

    static std::string pattern_for(std::string_view origin)
    {
        return fmt::format("[Starfall]{:<32}[%^%5l%$] %v", origin);
    }

    std::shared_ptr<spdlog::sinks::stdout_color_sink_mt> m_console;
    std::shared_ptr<spdlog::sinks::basic_file_sink_mt> m_file;
};

} // namespace starfall

#endif // STARFALL_LOGGER_HPP
