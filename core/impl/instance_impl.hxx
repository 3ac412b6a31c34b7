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

#include <fluentdb/instance.hxx>
#include <fluentdb/instance_options.hxx>

#include <asio/executor_work_guard.hpp>
#include <asio/io_context.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <system_error>
#include <thread>

namespace fluentdb
{
namespace core
{
class document_store;
} // namespace core

/**
 * Shared state of an instance and of every handle derived from it: the io_context with its
 * thread, the document store and the options.
 */
class instance_impl : public std::enable_shared_from_this<instance_impl>
{
public:
  explicit instance_impl(instance_options::built options);
  instance_impl(const instance_impl&) = delete;
  instance_impl(instance_impl&&) = delete;
  auto operator=(const instance_impl&) = delete;
  auto operator=(instance_impl&&) = delete;
  ~instance_impl();

  [[nodiscard]] auto open(const document_store_factory& factory) -> std::error_code;
  void close(std::function<void()>&& handler);

  [[nodiscard]] auto io() -> asio::io_context&;
  [[nodiscard]] auto store() const -> const std::shared_ptr<core::document_store>&;
  [[nodiscard]] auto options() const -> const instance_options::built&;

  /**
   * Incremented whenever a database or a collection is deleted. Handles remember the epoch at
   * which they made sure their resource exists, and check again once it changed.
   */
  [[nodiscard]] auto epoch() const -> std::uint64_t;
  void advance_epoch();

  void add_database(std::string database_id, database_properties_handler&& handler);
  void databases(database_properties_list_handler&& handler);
  void clear(status_handler&& handler);

private:
  void stop();

  instance_options::built options_;
  // co-owned by the io thread, which may outlive this object when the last handle is released
  // from one of its own completions
  std::shared_ptr<asio::io_context> io_{ std::make_shared<asio::io_context>() };
  asio::executor_work_guard<asio::io_context::executor_type> work_;
  std::shared_ptr<core::document_store> store_{};
  std::atomic_uint64_t epoch_{ 0 };
  std::thread io_thread_;
};
} // namespace fluentdb
