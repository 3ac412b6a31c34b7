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

#include <fluentdb/common_options.hxx>
#include <fluentdb/error.hxx>

#include <tao/json/value.hpp>

#include <cstddef>
#include <functional>
#include <optional>
#include <utility>
#include <vector>

namespace fluentdb
{
struct get_changes_options : public common_options<get_changes_options> {
public:
  /**
   * Number of changed documents requested per change feed page. Overrides the page size the
   * collection was opened with for this call only.
   */
  auto page_size(std::size_t page_size) -> get_changes_options&
  {
    page_size_ = page_size;
    return self();
  }

  /**
   * Invoked with the documents of every change feed page before the checkpoint of the page is
   * stored. An error fails the call without advancing past the page, so the next call reads the
   * page again.
   */
  auto on_page(std::function<error(const std::vector<tao::json::value>&)> hook) -> get_changes_options&
  {
    on_page_ = std::move(hook);
    return self();
  }

  struct built : public common_options<get_changes_options>::built {
    std::optional<std::size_t> page_size;
    std::function<error(const std::vector<tao::json::value>&)> on_page;
  };

  [[nodiscard]] auto build() const -> built
  {
    return { build_common_options(), page_size_, on_page_ };
  }

private:
  std::optional<std::size_t> page_size_{};
  std::function<error(const std::vector<tao::json::value>&)> on_page_{};
};

/**
 * Receives the documents changed since the previous call, from every partition key range.
 */
using get_changes_handler = std::function<void(error, std::vector<tao::json::value>)>;
} // namespace fluentdb
