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

#pragma once

#include "level.hxx"

#include <spdlog/fwd.h>

#include <cstddef>
#include <memory>
#include <string>

namespace fluentdb::core::logger
{

struct configuration {
  /**
   *  The base name of the log files (rotated files get .1, .2, ... appended by the sink)
   */
  std::string filename;

  /**
   * 8192 item size for the logging queue. This is equivalent to 2 MB
   */
  std::size_t buffer_size{ 8192 };

  /**
   * 100 MB per cycled file
   */
  std::size_t cycle_size{ 100LLU * 1024 * 1024 };

  /**
   * Number of rotated files to keep next to the active one
   */
  std::size_t max_files{ 5 };

  /**
   * if running in a unit test or not
   */
  bool unit_test{ false };

  /**
   * Should messages be passed on to the console via stderr
   */
  bool console{ true };

  /**
   * The default log level to initialize the logger to
   */
  level log_level{ level::info };

  /**
   * Messages below this level are not written to the console sink
   */
  level console_sink_log_level{ level::warn };

  /**
   * Custom sink to use, if desired
   */
  std::shared_ptr<spdlog::sinks::sink> sink{ nullptr };
};

} // namespace fluentdb::core::logger
