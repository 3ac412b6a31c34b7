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

#include "core/utils/movable_function.hxx"

#include <fluentdb/properties.hxx>

#include <fmt/core.h>
#include <tao/json/value.hpp>

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace fluentdb::core
{
struct collection_link {
  std::string database_id;
  std::string collection_id;

  [[nodiscard]] auto to_string() const -> std::string
  {
    return fmt::format("dbs/{}/colls/{}", database_id, collection_id);
  }

  auto operator==(const collection_link& other) const -> bool
  {
    return database_id == other.database_id && collection_id == other.collection_id;
  }
};

/**
 * Contiguous slice of the partition key space of a collection. The boundaries are opaque to the
 * client, only the identifier is used to scope change feeds.
 */
struct partition_key_range {
  std::string id{};
  std::string min_inclusive{};
  std::string max_exclusive{};
};

struct partition_range_page {
  std::vector<partition_key_range> ranges{};
  /// Absent when the listing is exhausted.
  std::optional<std::string> continuation_token{};
};

struct change_feed_page {
  std::vector<tao::json::value> documents{};
  /// Position right after the last document of this page.
  std::string continuation_token{};
};

struct change_feed_request {
  collection_link link{};
  std::string partition_key_range_id{};
  std::optional<std::string> continuation_token{};
  bool start_from_beginning{ true };
  std::size_t page_size{ 1 };
};

using status_handler = utils::movable_function<void(std::error_code)>;
using database_handler = utils::movable_function<void(std::error_code, database_properties)>;
using database_list_handler =
  utils::movable_function<void(std::error_code, std::vector<database_properties>)>;
using collection_handler = utils::movable_function<void(std::error_code, collection_properties)>;
using collection_list_handler =
  utils::movable_function<void(std::error_code, std::vector<collection_properties>)>;
using document_handler = utils::movable_function<void(std::error_code, tao::json::value)>;
using document_list_handler =
  utils::movable_function<void(std::error_code, std::vector<tao::json::value>)>;
using partition_range_page_handler =
  utils::movable_function<void(std::error_code, partition_range_page)>;
using change_feed_page_handler = utils::movable_function<void(std::error_code, change_feed_page)>;

/**
 * Incremental reader of the change feed of one partition key range.
 *
 * Pages must be requested one at a time: the continuation token of a page is only meaningful
 * once the previous page has been consumed.
 */
class change_feed_cursor
{
public:
  virtual ~change_feed_cursor() = default;

  [[nodiscard]] virtual auto has_more() const -> bool = 0;
  virtual void next_page(change_feed_page_handler&& handler) = 0;
};

/**
 * Capability surface of the document database service.
 *
 * Every operation completes through its handler, either inline or on the executor of the
 * implementation.
 */
class document_store
{
public:
  virtual ~document_store() = default;

  virtual void create_database(std::string database_id,
                               bool if_not_exists,
                               database_handler&& handler) = 0;
  virtual void read_database(std::string database_id, database_handler&& handler) = 0;
  virtual void delete_database(std::string database_id, status_handler&& handler) = 0;
  virtual void list_databases(database_list_handler&& handler) = 0;

  virtual void create_collection(collection_link link,
                                 bool if_not_exists,
                                 collection_handler&& handler) = 0;
  virtual void read_collection(collection_link link, collection_handler&& handler) = 0;
  virtual void delete_collection(collection_link link, status_handler&& handler) = 0;
  virtual void list_collections(std::string database_id, collection_list_handler&& handler) = 0;

  /**
   * Stores a new document. A missing or empty "id" member is replaced by a generated
   * identifier. Fails with errc::document_store::document_exists if the identifier is taken.
   */
  virtual void create_document(collection_link link,
                               tao::json::value document,
                               document_handler&& handler) = 0;
  virtual void upsert_document(collection_link link,
                               tao::json::value document,
                               document_handler&& handler) = 0;
  virtual void read_document(collection_link link,
                             std::string document_id,
                             document_handler&& handler) = 0;
  virtual void delete_document(collection_link link,
                               std::string document_id,
                               status_handler&& handler) = 0;
  virtual void list_documents(collection_link link, document_list_handler&& handler) = 0;

  /**
   * Returns one page of the partition key ranges of the collection. Pass the continuation token
   * of the previous page to get the next one.
   */
  virtual void list_partition_ranges(collection_link link,
                                     std::optional<std::string> continuation_token,
                                     partition_range_page_handler&& handler) = 0;

  [[nodiscard]] virtual auto open_change_feed(change_feed_request request)
    -> std::shared_ptr<change_feed_cursor> = 0;
};
} // namespace fluentdb::core
