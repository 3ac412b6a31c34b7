/* -*- Mode: C++; tab-width: 4; c-basic-offset: 4; indent-tabs-mode: nil -*- */
/*
 *   Copyright 2026-Present Couchbase, Inc.
 *
 *   Licensed under the Apache License, Version 2.0 (the "License");
 *   you may not use this file except in compliance with the License.
 *   You may obtain a copy of the License at
 *
 *       http://www.apache.org/licenses/LICENSE-2.0
 *
 *   Unless required by applicable law or agreed to in writing, software
 *   distributed under the License is distributed on an "AS IS" BASIS,
 *   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 *   See the License for the specific language governing permissions and
 *   limitations under the License.
 */

/*
 *   A note on the thread safety of the logger API:
 *
 *   The API is thread safe unless the underlying logger object is changed
 * during runtime. This means some methods can only be safely called if the
 * caller guarantees no other threads exist and/or are calling the logging
 * functions.
 */

#pragma once

#include "level.hxx"

#include <fmt/core.h>
#include <spdlog/fwd.h>

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace fluentdb::core::logger
{
struct configuration;

level
level_from_str(const std::string& str);

/**
 * Initialize the logger.
 *
 * The default level for the created logger is set to INFO
 *
 * See note about thread safety at the top of the file
 *
 * @param logger_settings the configuration for the logger
 * @return optional error message if something goes wrong
 */
std::optional<std::string>
create_file_logger(const configuration& logger_settings);

/**
 * Initialize the logger with the blackhole logger object
 *
 * This method is intended to be used by unit tests which don't need any output (but may call
 * methods who tries to fetch the logger)
 *
 * See note about thread safety at the top of the file
 */
void
create_blackhole_logger();

/**
 * Initialize the logger with the logger which logs to the console
 *
 * See note about thread safety at the top of the file
 */
void
create_console_logger();

/**
 * Initialize the logger with a single custom sink, logging everything down to TRACE
 */
void
create_sink_logger(std::shared_ptr<spdlog::sinks::sink> sink);

/**
 * Set the log level of all registered spdLoggers
 * @param log severity level
 */
void
set_log_levels(level lvl);

/**
 * Checks whether a specific level should be logged based on the current
 * configuration.
 * @param level severity level to check
 * @return true if we should log at this level
 */
bool
should_log(level lvl);

namespace detail
{
void
log(const char* file, int line, const char* function, level lvl, std::string_view msg);
} // namespace detail

/**
 * Logs a formatted message at a specific severity level.
 */
template<typename String, typename... Args>
inline void
log(const char* file, int line, const char* function, level lvl, const String& msg, Args&&... args)
{
  detail::log(file, line, function, lvl, fmt::format(msg, std::forward<Args>(args)...));
}

/**
 * Tell the logger to flush its buffers
 */
void
flush();

/**
 * Tell the logger to shut down (flush buffers) and release _ALL_
 * loggers (you'd need to create new loggers after this method)
 */
void
shutdown();

} // namespace fluentdb::core::logger

#if defined(__GNUC__) || defined(__clang__)
#define FLUENTDB_LOGGER_FUNCTION __PRETTY_FUNCTION__
#else
#define FLUENTDB_LOGGER_FUNCTION __FUNCTION__
#endif
/**
 * We implement this macro to avoid having argument evaluation performed
 * on log messages which likely will not actually be logged due to their
 * severity value not matching the logger.
 */
#define FLUENTDB_LOG(file, line, function, severity, ...)                                          \
  do {                                                                                             \
    if (fluentdb::core::logger::should_log(severity)) {                                            \
      fluentdb::core::logger::log(file, line, function, severity, __VA_ARGS__);                    \
    }                                                                                              \
  } while (false)

#define FLUENTDB_LOG_TRACE(...)                                                                    \
  FLUENTDB_LOG(__FILE__,                                                                           \
               __LINE__,                                                                           \
               FLUENTDB_LOGGER_FUNCTION,                                                           \
               fluentdb::core::logger::level::trace,                                               \
               __VA_ARGS__)
#define FLUENTDB_LOG_DEBUG(...)                                                                    \
  FLUENTDB_LOG(__FILE__,                                                                           \
               __LINE__,                                                                           \
               FLUENTDB_LOGGER_FUNCTION,                                                           \
               fluentdb::core::logger::level::debug,                                               \
               __VA_ARGS__)
#define FLUENTDB_LOG_INFO(...)                                                                     \
  FLUENTDB_LOG(__FILE__,                                                                           \
               __LINE__,                                                                           \
               FLUENTDB_LOGGER_FUNCTION,                                                           \
               fluentdb::core::logger::level::info,                                                \
               __VA_ARGS__)
#define FLUENTDB_LOG_WARNING(...)                                                                  \
  FLUENTDB_LOG(__FILE__,                                                                           \
               __LINE__,                                                                           \
               FLUENTDB_LOGGER_FUNCTION,                                                           \
               fluentdb::core::logger::level::warn,                                                \
               __VA_ARGS__)
#define FLUENTDB_LOG_ERROR(...)                                                                    \
  FLUENTDB_LOG(__FILE__,                                                                           \
               __LINE__,                                                                           \
               FLUENTDB_LOGGER_FUNCTION,                                                           \
               fluentdb::core::logger::level::err,                                                 \
               __VA_ARGS__)
