/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file logger.hpp
 * @brief Thread-safe diagnostic logging facility for SwissUID tooling.
 *
 * @details
 * This header declares the `Logger` class, the centralized reporting interface
 * of the command-line front end and the request dispatcher. Every entry is
 * written atomically to `stderr`, keeping `stdout` reserved for command output
 * (validated identifiers, JSON responses).
 */

#pragma once

#include <mutex>
#include <string>

namespace swissuid::infra {

/**
 * @enum LogLevel
 * @brief Defines the severity hierarchy for diagnostic messages.
 */
enum class LogLevel {
    TRACE, ///< Granular execution flow details (e.g., scanner positions).
    DEBUG, ///< Diagnostic information (e.g., rejected identifiers and why).
    INFO,  ///< Nominal operational events (e.g., startup configuration).
    WARN,  ///< Non-blocking anomalies (e.g., malformed requests).
    ERROR, ///< Recoverable runtime errors.
    FATAL  ///< Critical failures requiring process termination.
};

/**
 * @class Logger
 * @brief A static utility class providing process-wide logging.
 *
 * @details
 * Messages below the configured threshold are discarded before the lock is
 * taken. The default threshold is `WARN`, so a quiet run of the tool emits
 * nothing but its results.
 */
class Logger {
  public:
    /**
     * @brief Writes a formatted diagnostic message to `stderr`.
     *
     * The output includes a timestamp, the severity tag, and the payload.
     *
     * @param level The severity classification of the message.
     * @param message The content payload to be logged.
     *
     * @code
     * // Example Usage:
     * swissuid::infra::Logger::log(LogLevel::DEBUG, "Handler: Rejected 'CHE-109.322.552'");
     * @endcode
     */
    static void log(LogLevel level, const std::string& message);

    /**
     * @brief Sets the minimum severity that reaches the console.
     */
    static void set_level(LogLevel level);

    /// @brief Returns the active minimum severity.
    static LogLevel level();

    /**
     * @brief Resolves a case-insensitive level name ("trace" ... "fatal").
     *
     * @param name The textual level, as given on the command line.
     * @param out Receives the resolved level on success.
     * @return true if the name denotes a known level, false otherwise (`out` untouched).
     */
    static bool parse_level(const std::string& name, LogLevel& out);

  private:
    /// @brief Serializes console writes across threads.
    static std::mutex mutex_;

    /// @brief Active threshold, guarded by `mutex_`.
    static LogLevel threshold_;
};

} // namespace swissuid::infra
