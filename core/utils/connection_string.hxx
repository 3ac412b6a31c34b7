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

#include <fluentdb/instance_options.hxx>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace fluentdb::core::utils
{
/**
 * Parsed form of "scheme://host[:port][/][?key=value&...]".
 *
 * Recognized parameters are applied to the options, unknown parameters and values that cannot be
 * interpreted are reported as warnings and leave the option untouched.
 */
struct connection_string {
  static constexpr auto memory_scheme{ "memory" };

  std::string scheme{ memory_scheme };
  std::string host{};
  std::optional<std::uint16_t> port{};
  std::map<std::string, std::string> params{};
  instance_options options{};

  std::vector<std::string> warnings{};
  std::optional<std::string> error{};
};

connection_string
parse_connection_string(const std::string& input, instance_options options = {});
} // namespace fluentdb::core::utils
