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

#include "test_helper.hxx"

#include <fluentdb/instance.hxx>
#include <fluentdb/logger.hxx>

#include "core/logger/logger.hxx"

#include <algorithm>
#include <mutex>
#include <optional>

namespace
{
struct captured_logs {
  std::mutex mutex{};
  std::vector<std::pair<fluentdb::logger::log_level, std::string>> entries{};

  auto callback(std::optional<fluentdb::logger::log_level> only = {}) -> fluentdb::logger::log_callback
  {
    return [this, only](std::string_view msg,
                        fluentdb::logger::log_level level,
                        fluentdb::logger::log_location location) {
      if (only && level != only.value()) {
        return;
      }
      std::string log_entry = std::string(msg) + " [" + location.file + ":" +
                              std::to_string(location.line) + " " + location.function + "]";
      const std::scoped_lock lock(mutex);
      entries.emplace_back(level, std::move(log_entry));
    };
  }

  auto size() -> std::size_t
  {
    const std::scoped_lock lock(mutex);
    return entries.size();
  }

  auto contains(std::string_view needle) -> bool
  {
    const std::scoped_lock lock(mutex);
    return std::any_of(entries.begin(), entries.end(), [needle](const auto& entry) {
      return entry.second.find(needle) != std::string::npos;
    });
  }
};
} // namespace

TEST_CASE("unit: simple callback", "[unit]")
{
  captured_logs logs;
  fluentdb::logger::register_log_callback(logs.callback());

  FLUENTDB_LOG_INFO("Test log message 1");
  FLUENTDB_LOG_WARNING("Test log message {}", 2);

  REQUIRE(logs.size() == 2);
  REQUIRE(logs.entries[0].first == fluentdb::logger::log_level::info);
  REQUIRE(logs.entries[0].second.find("Test log message 1") != std::string::npos);
  REQUIRE(logs.entries[1].first == fluentdb::logger::log_level::warn);
  REQUIRE(logs.entries[1].second.find("Test log message 2") != std::string::npos);
  REQUIRE(logs.entries[1].second.find("test_unit_logger.cxx") != std::string::npos);

  fluentdb::logger::unregister_log_callback();
}

TEST_CASE("unit: custom callback level filtering", "[unit]")
{
  captured_logs logs;
  fluentdb::logger::register_log_callback(logs.callback(fluentdb::logger::log_level::error));

  FLUENTDB_LOG_INFO("Test log message 1");
  FLUENTDB_LOG_ERROR("Test log message 2");

  REQUIRE(logs.size() == 1);
  REQUIRE(logs.contains("Test log message 2"));

  fluentdb::logger::unregister_log_callback();
}

TEST_CASE("unit: log level of the callback logger", "[unit]")
{
  captured_logs logs;
  fluentdb::logger::register_log_callback(logs.callback());
  fluentdb::logger::set_level(fluentdb::logger::log_level::warn);

  FLUENTDB_LOG_DEBUG("Test debug message");
  FLUENTDB_LOG_WARNING("Test warning message");

  REQUIRE(logs.size() == 1);
  REQUIRE(logs.contains("Test warning message"));

  fluentdb::logger::unregister_log_callback();
}

TEST_CASE("unit: custom callback nullptr", "[unit]")
{
  fluentdb::logger::register_log_callback(nullptr);

  FLUENTDB_LOG_INFO("Test log message 1");
}

TEST_CASE("unit: reregister custom log callback", "[unit]")
{
  captured_logs logs;
  fluentdb::logger::register_log_callback(logs.callback(fluentdb::logger::log_level::error));

  FLUENTDB_LOG_ERROR("Test error message");

  fluentdb::logger::unregister_log_callback();

  FLUENTDB_LOG_ERROR("Test error message 2");

  fluentdb::logger::register_log_callback(logs.callback(fluentdb::logger::log_level::error));

  FLUENTDB_LOG_ERROR("Test error message 3");

  REQUIRE(logs.size() == 2);
  REQUIRE(logs.entries[0].second.find("Test error message") != std::string::npos);
  REQUIRE(logs.entries[1].second.find("Test error message 3") != std::string::npos);

  fluentdb::logger::unregister_log_callback();
}

TEST_CASE("unit: connection string warnings are logged", "[unit]")
{
  captured_logs logs;
  fluentdb::logger::register_log_callback(logs.callback(fluentdb::logger::log_level::warn));

  auto [err, instance] = fluentdb::instance::connect("memory://local?colour=blue", "").get();
  REQUIRE_NO_ERROR(err);
  instance.close().get();

  REQUIRE(logs.contains(R"(unknown parameter "colour")"));

  fluentdb::logger::unregister_log_callback();
}
