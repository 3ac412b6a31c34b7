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

#include <fluentdb/error.hxx>
#include <fluentdb/get_changes_options.hxx>
#include <fluentdb/properties.hxx>
#include <fluentdb/status_handler.hxx>

#include <tao/json/value.hpp>

#include <functional>
#include <future>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace fluentdb
{
#ifndef FLUENTDB_DOXYGEN
class collection_impl;
class database_impl;
#endif

using document_handler = std::function<void(error, tao::json::value)>;
using document_list_handler = std::function<void(error, std::vector<tao::json::value>)>;
using collection_properties_handler = std::function<void(error, collection_properties)>;

/**
 * Handle to a collection of JSON documents.
 *
 * The database and the collection are created on first use. Copies of the handle share the
 * change feed checkpoints, while every handle obtained from @ref database::collection starts
 * with its own (unless the instance keeps checkpoints in a directory).
 */
class collection
{
public:
  [[nodiscard]] auto id() const -> const std::string&;
  [[nodiscard]] auto database_id() const -> const std::string&;

  /**
   * Stores a new document. A missing or empty "id" member is assigned by the store.
   *
   * @return the stored document, including its identifier and system properties
   */
  void add(tao::json::value document, document_handler&& handler) const;
  [[nodiscard]] auto add(tao::json::value document) const
    -> std::future<std::pair<error, tao::json::value>>;

  /**
   * Stores several documents concurrently and completes when all of them are stored. The first
   * failure is reported, documents stored before it are kept.
   */
  void add(std::vector<tao::json::value> documents, document_list_handler&& handler) const;
  [[nodiscard]] auto add(std::vector<tao::json::value> documents) const
    -> std::future<std::pair<error, std::vector<tao::json::value>>>;

  void get(std::string document_id, document_handler&& handler) const;
  [[nodiscard]] auto get(std::string document_id) const
    -> std::future<std::pair<error, tao::json::value>>;

  void upsert(tao::json::value document, document_handler&& handler) const;
  [[nodiscard]] auto upsert(tao::json::value document) const
    -> std::future<std::pair<error, tao::json::value>>;

  void remove(std::string document_id, status_handler&& handler) const;
  [[nodiscard]] auto remove(std::string document_id) const -> std::future<error>;

  /**
   * Returns every document of the collection.
   */
  void query(document_list_handler&& handler) const;
  [[nodiscard]] auto query() const -> std::future<std::pair<error, std::vector<tao::json::value>>>;

  /**
   * Returns the documents created or modified since the previous call on this handle (or any of
   * its copies). The first call returns the whole history of the collection.
   *
   * Calls are serialized: a call issued while another one is running starts once it completes.
   * Completed pages are never returned twice, but when a call fails the documents of the page
   * whose checkpoint could not be stored may be returned again by the next call.
   */
  void get_changes(const get_changes_options& options, get_changes_handler&& handler) const;
  [[nodiscard]] auto get_changes(const get_changes_options& options = {}) const
    -> std::future<std::pair<error, std::vector<tao::json::value>>>;

  /**
   * Fails the running and queued @ref get_changes calls with errc::common::request_canceled.
   */
  void cancel_get_changes() const;

  void read(collection_properties_handler&& handler) const;
  [[nodiscard]] auto read() const -> std::future<std::pair<error, collection_properties>>;

  /**
   * Deletes the collection and its documents. The next operation creates it again.
   */
  void remove(status_handler&& handler) const;
  [[nodiscard]] auto remove() const -> std::future<error>;

  /**
   * Deletes the collection, creates it again, and forgets the change feed checkpoints.
   */
  void clear(status_handler&& handler) const;
  [[nodiscard]] auto clear() const -> std::future<error>;

  /**
   * Handle to the same collection with its own, empty, change feed checkpoints.
   */
  [[nodiscard]] auto with_fresh_checkpoints() const -> collection;

private:
  friend class database_impl;

  explicit collection(std::shared_ptr<collection_impl> impl);

  std::shared_ptr<collection_impl> impl_;
};
} // namespace fluentdb
