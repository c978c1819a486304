/**
 * @file Logger.h
 * @brief Declares Logger, the process-wide file log for a game session.
 *
 * One log file per run, named after the command (./ants.log), opened in append mode with a
 * session banner. Every line carries a timestamp, the level and, once the colony starts its first
 * turn, the turn number: `2025-01-01 12:00:00.000 [INFO] [turn 3] Bee(2, tunnel_0_4) ...`.
 * Messages logged before init() are dropped, so engine code can log unconditionally.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include <exception>
#include <string>

/**
 * @class Logger
 * @brief Static, mutex-guarded session logger with a level filter.
 */
class Logger {
public:
    /** @brief Severity threshold; None silences the log entirely. */
    enum class Level { Debug = 0, Info = 1, Warn = 2, Error = 3, None = 4 };

    // Session
    /** @brief Open ./<basename of argv0>.log. */
    static void initFromArgv0(const char* argv0);
    /** @brief Open @p filename for appending; reads LOG_LEVEL (debug, info, warn, error, none). */
    static void init(const std::string& filename);
    /** @brief Write the closing banner and close the file; repeated calls are harmless. */
    static void shutdown();

    // Messages
    static void debug(const std::string& msg);
    static void info(const std::string& msg);
    static void warn(const std::string& msg);
    static void error(const std::string& msg);
    /** @brief Log @p e at Error level, prefixed with @p where. */
    static void logException(const std::string& where, const std::exception& e);
    /** @brief Log an exception of unknown type at Error level. */
    static void logUnknownException(const std::string& where);

    // Filtering and context
    /** @brief Drop messages below @p lvl (default Info). */
    static void setLevel(Level lvl);
    static Level level();
    /** @brief Turn number stamped on following lines; negative hides the tag. */
    static void setTurn(int turn);

private:
    static void logImpl(Level lvl, const std::string& msg);
};
