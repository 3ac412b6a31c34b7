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

#include <optional>
#include <string>
#include <system_error>

namespace fluentdb::core
{
/**
 * Captures which resource a failed store request addressed, so the public error can report it.
 */
struct operation_error_context {
  std::error_code ec{};
  std::string operation{};
  std::optional<std::string> database_id{};
  std::optional<std::string> collection_id{};
  std::optional<std::string> document_id{};
  std::optional<std::string> partition_key_range_id{};
};
} // namespace fluentdb::core
