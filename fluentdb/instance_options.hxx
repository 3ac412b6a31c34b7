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

#include <cstddef>
#include <string>
#include <utility>

namespace fluentdb
{
/**
 * Client configuration. Values can also be supplied as connection string parameters, which
 * override the ones set here.
 */
class instance_options
{
public:
  static constexpr std::size_t default_change_feed_page_size{ 1 };
  static constexpr std::size_t default_max_partition_range_pages{ 1000 };
  static constexpr std::size_t default_partition_count{ 1 };
  static constexpr std::size_t default_range_page_size{ 100 };

  /**
   * Number of changed documents requested per change feed page.
   */
  auto change_feed_page_size(std::size_t size) -> instance_options&
  {
    change_feed_page_size_ = size;
    return *this;
  }

  /**
   * Maximum number of pages fetched while listing partition key ranges before the listing is
   * considered to never terminate.
   */
  auto max_partition_range_pages(std::size_t pages) -> instance_options&
  {
    max_partition_range_pages_ = pages;
    return *this;
  }

  /**
   * Erase resumption tokens of partition key ranges that are no longer listed by the store.
   */
  auto prune_orphaned_checkpoints(bool enable) -> instance_options&
  {
    prune_orphaned_checkpoints_ = enable;
    return *this;
  }

  /**
   * When set, change feed checkpoints are kept in JSON files below this directory (one file per
   * collection) and survive restarts. Otherwise they live in memory.
   */
  auto checkpoint_directory(std::string path) -> instance_options&
  {
    checkpoint_directory_ = std::move(path);
    return *this;
  }

  /**
   * Number of partition key ranges of new collections (in-process store only).
   */
  auto partition_count(std::size_t count) -> instance_options&
  {
    partition_count_ = count;
    return *this;
  }

  /**
   * Number of partition key ranges returned per listing page (in-process store only).
   */
  auto range_page_size(std::size_t size) -> instance_options&
  {
    range_page_size_ = size;
    return *this;
  }

  struct built {
    std::size_t change_feed_page_size;
    std::size_t max_partition_range_pages;
    bool prune_orphaned_checkpoints;
    std::string checkpoint_directory;
    std::size_t partition_count;
    std::size_t range_page_size;
  };

  [[nodiscard]] auto build() const -> built
  {
    return {
      change_feed_page_size_, max_partition_range_pages_, prune_orphaned_checkpoints_,
      checkpoint_directory_,  partition_count_,           range_page_size_,
    };
  }

private:
  std::size_t change_feed_page_size_{ default_change_feed_page_size };
  std::size_t max_partition_range_pages_{ default_max_partition_range_pages };
  bool prune_orphaned_checkpoints_{ false };
  std::string checkpoint_directory_{};
  std::size_t partition_count_{ default_partition_count };
  std::size_t range_page_size_{ default_range_page_size };
};
} // namespace fluentdb
