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

#include <fluentdb/database.hxx>
#include <fluentdb/error.hxx>
#include <fluentdb/instance_options.hxx>
#include <fluentdb/properties.hxx>
#include <fluentdb/status_handler.hxx>

#include <functional>
#include <future>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace asio
{
class io_context;
} // namespace asio

namespace fluentdb
{
#ifndef FLUENTDB_DOXYGEN
namespace core
{
class document_store;
} // namespace core
class instance_impl;
#endif

class instance;

using instance_connect_handler = std::function<void(error, instance)>;
using database_properties_list_handler = std::function<void(error, std::vector<database_properties>)>;

/**
 * Creates the document store used by an instance. It is invoked once, with the io_context that
 * runs every completion of the instance.
 */
using document_store_factory =
  std::function<std::shared_ptr<core::document_store>(asio::io_context&)>;

/**
 * Entry point: a connection to a document database account.
 */
class instance
{
public:
  /**
   * Connects to the account addressed by the connection string.
   *
   * The "memory" scheme selects the in-process store, e.g.
   * "memory://local?partition_count=4&change_feed_page_size=10". Parameters of the connection
   * string take precedence over the options.
   *
   * @param account_key key of the account, not used by the in-process store
   */
  static void connect(const std::string& connection_string,
                      const std::string& account_key,
                      const instance_options& options,
                      instance_connect_handler&& handler);

  [[nodiscard]] static auto connect(const std::string& connection_string,
                                    const std::string& account_key,
                                    const instance_options& options = {})
    -> std::future<std::pair<error, instance>>;

  /**
   * Connects using a store created by the factory.
   */
  static void connect(document_store_factory factory,
                      const instance_options& options,
                      instance_connect_handler&& handler);

  [[nodiscard]] static auto connect(document_store_factory factory,
                                    const instance_options& options = {})
    -> std::future<std::pair<error, instance>>;

  instance() = default;
  instance(const instance& other) = default;
  instance(instance&& other) = default;
  auto operator=(const instance& other) -> instance& = default;
  auto operator=(instance&& other) -> instance& = default;
  ~instance() = default;

  /**
   * Stops the I/O thread. Handles obtained from the instance must not be used afterwards.
   */
  void close(std::function<void()>&& handler) const;
  [[nodiscard]] auto close() const -> std::future<void>;

  /**
   * Handle to a database, created on first use.
   */
  [[nodiscard]] auto database(std::string database_id) const -> fluentdb::database;

  /**
   * Creates a database. Fails with errc::document_store::database_exists if it exists.
   */
  void add_database(std::string database_id, database_properties_handler&& handler) const;
  [[nodiscard]] auto add_database(std::string database_id) const
    -> std::future<std::pair<error, database_properties>>;

  /**
   * Creates several databases concurrently and completes when all requests completed.
   */
  void add_databases(std::vector<std::string> database_ids,
                     database_properties_list_handler&& handler) const;
  [[nodiscard]] auto add_databases(std::vector<std::string> database_ids) const
    -> std::future<std::pair<error, std::vector<database_properties>>>;

  void databases(database_properties_list_handler&& handler) const;
  [[nodiscard]] auto databases() const
    -> std::future<std::pair<error, std::vector<database_properties>>>;

  /**
   * Deletes every database of the account.
   */
  void clear(status_handler&& handler) const;
  [[nodiscard]] auto clear() const -> std::future<error>;

private:
  explicit instance(std::shared_ptr<instance_impl> impl);

  std::shared_ptr<instance_impl> impl_{};
};
} // namespace fluentdb
