#pragma once

#include <string>
#include <memory>

namespace voice_relay {

/**
 * @brief Log levels for filtering output
 */
enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

/**
 * @brief Process-wide, thread-safe logger
 *
 * Lines look like `[LEVEL] 2024-05-01 12:00:00.123 [thread]: message`.
 * Console output always goes to stderr: stdout carries protocol frames
 * when the relay runs over stdio. Each session actor and task thread tags
 * itself with set_thread_name(), so interleaved turns stay readable.
 */
class Logger {
public:
    /**
     * @brief Initialize logger with minimum log level
     * @param min_level Minimum level to output (default: INFO)
     * @param output_file Optional file appended to in addition to stderr
     * @return false if the file could not be opened (stderr still works)
     */
    static bool initialize(LogLevel min_level = LogLevel::INFO,
                           const std::string& output_file = "");

    static void shutdown();

    static void debug(const std::string& message);
    static void info(const std::string& message);
    static void warn(const std::string& message);
    static void error(const std::string& message);

    static void set_level(LogLevel level);
    static LogLevel get_level();

    /// True if a message at `level` would be written
    static bool enabled(LogLevel level);

    /**
     * @brief Parse "debug" / "info" / "warn" / "error" (case-insensitive)
     * @return Parsed level, or INFO for unknown names
     */
    static LogLevel parse_level(const std::string& name);

    /// Label printed for the calling thread ("main" until set)
    static void set_thread_name(const std::string& name);

private:
    class Impl;
    static std::unique_ptr<Impl> impl_;

    static void log(LogLevel level, const std::string& message);
    static const char* level_string(LogLevel level);
};

// Message strings are only built when the level is enabled
#define VOICE_RELAY_LOG_AT(level, fn, msg) \
    do { \
        if (voice_relay::Logger::enabled(level)) voice_relay::Logger::fn(msg); \
    } while (0)

#define LOG_DEBUG(msg) VOICE_RELAY_LOG_AT(voice_relay::LogLevel::DEBUG, debug, \
    "[" + std::string(__FILE__) + ":" + std::to_string(__LINE__) + "] " + (msg))
#define LOG_INFO(msg) voice_relay::Logger::info(msg)
#define LOG_WARN(msg) voice_relay::Logger::warn(msg)
#define LOG_ERROR(msg) voice_relay::Logger::error(msg)

// Component tags
#define LOG_AUDIO(msg) VOICE_RELAY_LOG_AT(voice_relay::LogLevel::DEBUG, debug, std::string("[Audio] ") + (msg))
#define LOG_VAD(msg) VOICE_RELAY_LOG_AT(voice_relay::LogLevel::DEBUG, debug, std::string("[VAD] ") + (msg))
#define LOG_STT(msg) VOICE_RELAY_LOG_AT(voice_relay::LogLevel::INFO, info, std::string("[STT] ") + (msg))
#define LOG_LLM(msg) VOICE_RELAY_LOG_AT(voice_relay::LogLevel::INFO, info, std::string("[LLM] ") + (msg))
#define LOG_TTS(msg) VOICE_RELAY_LOG_AT(voice_relay::LogLevel::INFO, info, std::string("[TTS] ") + (msg))
#define LOG_PROTO(msg) voice_relay::Logger::warn(std::string("[Proto] ") + (msg))
#define LOG_SESSION(id, msg) \
    VOICE_RELAY_LOG_AT(voice_relay::LogLevel::INFO, info, std::string("[session ") + (id) + "] " + (msg))

} // namespace voice_relay
