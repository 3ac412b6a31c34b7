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

#include <fluentdb/collection.hxx>
#include <fluentdb/document_collection.hxx>
#include <fluentdb/document_traits.hxx>
#include <fluentdb/error.hxx>
#include <fluentdb/properties.hxx>
#include <fluentdb/status_handler.hxx>

#include <functional>
#include <future>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace fluentdb
{
#ifndef FLUENTDB_DOXYGEN
class database_impl;
#endif

using database_properties_handler = std::function<void(error, database_properties)>;
using collection_properties_list_handler = std::function<void(error, std::vector<collection_properties>)>;

/**
 * Handle to a database. The database is created on first use.
 */
class database
{
public:
  [[nodiscard]] auto id() const -> const std::string&;

  /**
   * Handle to a collection of JSON documents, created on first use.
   */
  [[nodiscard]] auto collection(std::string collection_id) const -> fluentdb::collection;

  template<typename Document>
  [[nodiscard]] auto collection(std::string collection_id) const -> document_collection<Document>
  {
    return document_collection<Document>{ collection(std::move(collection_id)) };
  }

  /**
   * Typed collection named after the document type (see fluentdb::document_traits).
   */
  template<typename Document>
  [[nodiscard]] auto collection() const -> document_collection<Document>
  {
    return collection<Document>(default_collection_name<Document>());
  }

  /**
   * Creates a collection. Fails with errc::document_store::collection_exists if it exists.
   */
  void add_collection(std::string collection_id, collection_properties_handler&& handler) const;
  [[nodiscard]] auto add_collection(std::string collection_id) const
    -> std::future<std::pair<error, collection_properties>>;

  /**
   * Creates several collections concurrently and completes when all requests completed.
   */
  void add_collections(std::vector<std::string> collection_ids,
                       collection_properties_list_handler&& handler) const;
  [[nodiscard]] auto add_collections(std::vector<std::string> collection_ids) const
    -> std::future<std::pair<error, std::vector<collection_properties>>>;

  void collections(collection_properties_list_handler&& handler) const;
  [[nodiscard]] auto collections() const
    -> std::future<std::pair<error, std::vector<collection_properties>>>;

  void read(database_properties_handler&& handler) const;
  [[nodiscard]] auto read() const -> std::future<std::pair<error, database_properties>>;

  /**
   * Deletes the database and all its collections.
   */
  void remove(status_handler&& handler) const;
  [[nodiscard]] auto remove() const -> std::future<error>;

  /**
   * Deletes the database and creates it again, empty.
   */
  void clear(status_handler&& handler) const;
  [[nodiscard]] auto clear() const -> std::future<error>;

private:
  friend class instance;

  explicit database(std::shared_ptr<database_impl> impl);

  std::shared_ptr<database_impl> impl_;
};
} // namespace fluentdb
