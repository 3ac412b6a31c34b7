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

#include <fluentdb/logger.hxx>

#include "core/logger/configuration.hxx"
#include "core/logger/level.hxx"
#include "core/logger/logger.hxx"

#include <spdlog/details/log_msg.h>
#include <spdlog/sinks/base_sink.h>

#include <mutex>
#include <string>
#include <utility>

namespace fluentdb::logger
{
namespace
{
auto
convert_log_level(log_level level) -> core::logger::level
{
  switch (level) {
    case log_level::trace:
      return core::logger::level::trace;
    case log_level::debug:
      return core::logger::level::debug;
    case log_level::info:
      return core::logger::level::info;
    case log_level::warn:
      return core::logger::level::warn;
    case log_level::error:
      return core::logger::level::err;
    case log_level::critical:
      return core::logger::level::critical;
    case log_level::off:
    default:
      break;
  }
  return core::logger::level::off;
}

auto
convert_spdlog_level(spdlog::level::level_enum level) -> log_level
{
  switch (level) {
    case spdlog::level::trace:
      return log_level::trace;
    case spdlog::level::debug:
      return log_level::debug;
    case spdlog::level::info:
      return log_level::info;
    case spdlog::level::warn:
      return log_level::warn;
    case spdlog::level::err:
      return log_level::error;
    case spdlog::level::critical:
      return log_level::critical;
    default:
      break;
  }
  return log_level::off;
}

class callback_sink : public spdlog::sinks::base_sink<std::mutex>
{
public:
  explicit callback_sink(log_callback callback)
    : callback_{ std::move(callback) }
  {
  }

protected:
  void sink_it_(const spdlog::details::log_msg& msg) override
  {
    log_location location{
      msg.source.filename == nullptr ? std::string{} : std::string{ msg.source.filename },
      msg.source.line,
      msg.source.funcname == nullptr ? std::string{} : std::string{ msg.source.funcname },
    };
    callback_(std::string_view{ msg.payload.data(), msg.payload.size() },
              convert_spdlog_level(msg.level),
              std::move(location));
  }

  void flush_() override
  {
  }

private:
  log_callback callback_;
};
} // namespace

void
set_level(log_level level)
{
  core::logger::set_log_levels(convert_log_level(level));
}

void
initialize_console_logger()
{
  core::logger::create_console_logger();
}

void
initialize_file_logger(std::string_view filename)
{
  core::logger::configuration configuration{};
  configuration.filename = filename;
  configuration.console = false;
  if (auto err = core::logger::create_file_logger(configuration); err) {
    core::logger::create_console_logger();
    FLUENTDB_LOG_ERROR("unable to initialize file logger \"{}\": {}", filename, err.value());
  }
}

void
register_log_callback(log_callback callback)
{
  if (!callback) {
    return core::logger::create_blackhole_logger();
  }
  core::logger::create_sink_logger(std::make_shared<callback_sink>(std::move(callback)));
}

void
unregister_log_callback()
{
  core::logger::create_blackhole_logger();
}

void
flush_all_loggers()
{
  core::logger::flush();
}

void
shutdown_all_loggers()
{
  core::logger::shutdown();
}
} // namespace fluentdb::logger
