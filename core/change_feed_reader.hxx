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
#include "core/utils/movable_function.hxx"

#include <tao/json/value.hpp>
#include <tl/expected.hpp>

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace asio
{
class io_context;
} // namespace asio

namespace fluentdb::core
{
class checkpoint_store;
class change_feed_reader_impl;

struct change_feed_reader_options {
  static constexpr std::size_t default_page_size{ 1 };
  static constexpr std::size_t default_max_partition_range_pages{ 1000 };

  std::size_t page_size{ default_page_size };
  std::size_t max_partition_range_pages{ default_max_partition_range_pages };
  bool prune_orphaned_checkpoints{ false };
};

/**
 * Inspects the documents of a page before the token of the page is stored. A non-zero error code
 * fails the read and leaves the checkpoint of the range where it was.
 */
using change_feed_page_hook = std::function<std::error_code(const std::vector<tao::json::value>&)>;

/// Overrides applied to a single read.
struct change_feed_read_options {
  std::optional<std::size_t> page_size{};
  /// Counted from the moment the read is issued, including the time spent queued.
  std::optional<std::chrono::milliseconds> timeout{};
  change_feed_page_hook on_page{};
};

struct change_feed_read_error {
  std::error_code ec{};
  /// Set when the failure happened while reading a particular range.
  std::optional<std::string> partition_key_range_id{};
};

using change_feed_read_handler =
  utils::movable_function<void(change_feed_read_error, std::vector<tao::json::value>)>;

/**
 * Returns the documents changed in a collection since the previous read, across all of its
 * partition key ranges.
 *
 * Every read enumerates the partition key ranges of the collection, then drains the change feed
 * of each range starting at the token stored in the checkpoint store. The token of a range is
 * overwritten right after each page has been appended to the result, so a failed read keeps the
 * progress of the pages it already consumed, but none of its documents are returned. A retried
 * read may therefore deliver the page whose checkpoint could not be written a second time.
 *
 * Reads issued on the same reader are serialized: a read started while another one is in flight
 * waits for it and observes the tokens it stored.
 *
 * Completion handlers are invoked on the io_context. The blocking form must not be used from a
 * thread running that io_context.
 */
class change_feed_reader
{
public:
  change_feed_reader(asio::io_context& io,
                     std::shared_ptr<document_store> store,
                     collection_link link,
                     std::shared_ptr<checkpoint_store> checkpoints,
                     change_feed_reader_options options = {});

  [[nodiscard]] auto link() const -> const collection_link&;
  [[nodiscard]] auto checkpoints() const -> std::shared_ptr<checkpoint_store>;

  auto read(const change_feed_read_options& options = {})
    -> tl::expected<std::vector<tao::json::value>, std::error_code>;
  void read(const change_feed_read_options& options, change_feed_read_handler&& handler);

  /**
   * Fails the read in flight and every queued read with errc::common::request_canceled. Tokens
   * stored for pages that were fully processed are kept.
   */
  void cancel();

  /**
   * Forgets every stored token, so that the next read starts from the beginning of each range.
   */
  [[nodiscard]] auto reset_checkpoints() -> std::error_code;

private:
  std::shared_ptr<change_feed_reader_impl> impl_;
};
} // namespace fluentdb::core
