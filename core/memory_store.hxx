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

#include "core/document_store.hxx"

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace asio
{
class io_context;
} // namespace asio

namespace fluentdb::core
{
struct memory_store_options {
  static constexpr std::size_t default_partition_count{ 1 };
  static constexpr std::size_t default_range_page_size{ 100 };

  /// Number of partition key ranges of new collections.
  std::size_t partition_count{ default_partition_count };
  /// Number of partition key ranges returned per listing page.
  std::size_t range_page_size{ default_range_page_size };
};

/**
 * In-process document store.
 *
 * Each collection keeps the latest version of its documents. Every write is stamped with a
 * collection-wide logical sequence number (LSN), the change feed of a partition key range
 * returns the documents of that range in LSN order, and continuation tokens are decimal LSNs.
 * Deleted documents do not appear in the change feed.
 *
 * Completions are posted to the io_context.
 */
class memory_store
  : public document_store
  , public std::enable_shared_from_this<memory_store>
{
public:
  explicit memory_store(asio::io_context& io, memory_store_options options = {});

  [[nodiscard]] auto options() const -> const memory_store_options&;

  void create_database(std::string database_id, bool if_not_exists, database_handler&& handler) override;
  void read_database(std::string database_id, database_handler&& handler) override;
  void delete_database(std::string database_id, status_handler&& handler) override;
  void list_databases(database_list_handler&& handler) override;

  void create_collection(collection_link link, bool if_not_exists, collection_handler&& handler) override;
  void read_collection(collection_link link, collection_handler&& handler) override;
  void delete_collection(collection_link link, status_handler&& handler) override;
  void list_collections(std::string database_id, collection_list_handler&& handler) override;

  void create_document(collection_link link,
                       tao::json::value document,
                       document_handler&& handler) override;
  void upsert_document(collection_link link,
                       tao::json::value document,
                       document_handler&& handler) override;
  void read_document(collection_link link, std::string document_id, document_handler&& handler) override;
  void delete_document(collection_link link, std::string document_id, status_handler&& handler) override;
  void list_documents(collection_link link, document_list_handler&& handler) override;

  void list_partition_ranges(collection_link link,
                             std::optional<std::string> continuation_token,
                             partition_range_page_handler&& handler) override;

  [[nodiscard]] auto open_change_feed(change_feed_request request)
    -> std::shared_ptr<change_feed_cursor> override;

  /**
   * Replaces a partition key range by two new ranges covering its halves. The identifier of the
   * old range is not listed anymore, and its change feed fails with
   * errc::document_store::partition_range_gone.
   */
  void split_partition_range(collection_link link, std::string range_id, status_handler&& handler);

private:
  friend class memory_change_feed_cursor;

  struct stored_document {
    tao::json::value body;
    std::uint64_t lsn;
    std::uint32_t hash;
  };

  struct range_state {
    std::string id;
    std::uint64_t min_inclusive;
    std::uint64_t max_exclusive;
  };

  struct collection_state {
    collection_properties properties;
    std::uint64_t lsn{ 0 };
    std::uint64_t next_range_id{ 0 };
    std::vector<range_state> ranges{};
    std::map<std::string, stored_document> documents{};
  };

  struct database_state {
    database_properties properties;
    std::map<std::string, collection_state> collections{};
  };

  auto find_collection(const collection_link& link, std::error_code& ec) -> collection_state*;
  auto write_document(const collection_link& link, tao::json::value document, bool upsert, std::error_code& ec)
    -> tao::json::value;
  auto next_changes(const change_feed_request& request,
                    const std::optional<std::string>& token,
                    std::error_code& ec) -> std::pair<change_feed_page, bool>;
  auto next_resource_id() -> std::string;

  asio::io_context& io_;
  memory_store_options options_;
  std::mutex mutex_{};
  std::uint64_t resource_counter_{ 0 };
  std::map<std::string, database_state> databases_{};
};
} // namespace fluentdb::core
