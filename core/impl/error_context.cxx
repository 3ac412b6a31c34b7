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

#include <fluentdb/error_context.hxx>

#include "core/utils/json.hxx"

#include <string>
#include <utility>

namespace fluentdb
{
error_context::error_context(internal_error_context internal)
  : internal_{ std::move(internal) }
{
}

auto
error_context::to_json(error_context_json_format format) const -> std::string
{
  if (!internal_.is_object()) {
    return "{}";
  }
  if (format == error_context_json_format::pretty) {
    return core::utils::json::generate_pretty(internal_);
  }
  return core::utils::json::generate(internal_);
}

error_context::operator bool() const
{
  return internal_.is_object() && !internal_.get_object().empty();
}
} // namespace fluentdb
