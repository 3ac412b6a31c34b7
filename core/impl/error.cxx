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

#include "error.hxx"

#include <fluentdb/error.hxx>
#include <fluentdb/error_codes.hxx>
#include <fluentdb/error_context.hxx>

#include <tao/json/value.hpp>

#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace fluentdb
{
error::error(std::error_code ec, std::string message, fluentdb::error_context ctx)
  : ec_{ ec }
  , message_{ std::move(message) }
  , ctx_{ std::move(ctx) }
{
}

error::error(std::error_code ec,
             std::string message,
             fluentdb::error_context ctx,
             fluentdb::error cause)
  : ec_{ ec }
  , message_{ std::move(message) }
  , ctx_{ std::move(ctx) }
  , cause_{ std::make_shared<error>(std::move(cause)) }
{
}

auto
error::ec() const -> std::error_code
{
  return ec_;
}

auto
error::message() const -> const std::string&
{
  return message_;
}

auto
error::ctx() const -> const error_context&
{
  return ctx_;
}

auto
error::cause() const -> std::optional<error>
{
  if (!cause_) {
    return {};
  }

  return *cause_;
}

error::operator bool() const
{
  return ec_.value() != 0;
}

auto
error::operator==(const fluentdb::error& other) const -> bool
{
  return ec() == other.ec() && message() == other.message();
}

namespace core::impl
{
auto
make_error(const core::operation_error_context& core_ctx) -> error
{
  if (!core_ctx.ec) {
    return {};
  }

  tao::json::value ctx{
    { "ec", core_ctx.ec.value() },
    { "category", core_ctx.ec.category().name() },
    { "operation", core_ctx.operation },
  };
  if (core_ctx.database_id) {
    ctx["database"] = core_ctx.database_id.value();
  }
  if (core_ctx.collection_id) {
    ctx["collection"] = core_ctx.collection_id.value();
  }
  if (core_ctx.document_id) {
    ctx["document_id"] = core_ctx.document_id.value();
  }
  if (core_ctx.partition_key_range_id) {
    ctx["partition_key_range_id"] = core_ctx.partition_key_range_id.value();
  }
  return { core_ctx.ec, {}, error_context{ std::move(ctx) } };
}
} // namespace core::impl
} // namespace fluentdb
