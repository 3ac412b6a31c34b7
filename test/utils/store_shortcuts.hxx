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

#include <tao/json/value.hpp>

#include <cstdint>
#include <future>
#include <memory>
#include <string>
#include <tuple>
#include <utility>
#include <system_error>
#include <vector>

namespace fluentdb::core
{
class memory_store;
} // namespace fluentdb::core

namespace test::utils
{
/**
 * Invokes @p operation with a handler and blocks until the handler receives its results.
 */
template<typename... Results, typename Operation>
auto
execute(Operation&& operation) -> std::tuple<Results...>
{
  auto barrier = std::make_shared<std::promise<std::tuple<Results...>>>();
  auto future = barrier->get_future();
  operation([barrier](Results... results) {
    barrier->set_value(std::tuple<Results...>{ std::move(results)... });
  });
  return future.get();
}

/**
 * Blocking shortcuts over the document store, for setting up test data.
 */
auto
create_collection(fluentdb::core::document_store& store, const fluentdb::core::collection_link& link)
  -> std::error_code;

auto
insert_document(fluentdb::core::document_store& store,
                const fluentdb::core::collection_link& link,
                tao::json::value document) -> std::error_code;

auto
upsert_document(fluentdb::core::document_store& store,
                const fluentdb::core::collection_link& link,
                tao::json::value document) -> std::error_code;

auto
delete_document(fluentdb::core::document_store& store,
                const fluentdb::core::collection_link& link,
                const std::string& document_id) -> std::error_code;

/// Follows continuation tokens until the listing is exhausted.
auto
list_ranges(fluentdb::core::document_store& store, const fluentdb::core::collection_link& link)
  -> std::vector<fluentdb::core::partition_key_range>;

auto
split_range(fluentdb::core::memory_store& store,
            const fluentdb::core::collection_link& link,
            const std::string& range_id) -> std::error_code;

auto
make_document(const std::string& id, std::int64_t value = 0) -> tao::json::value;

/// Values of the "id" members, in order.
auto
ids_of(const std::vector<tao::json::value>& documents) -> std::vector<std::string>;

/// Values of the "id" members, sorted.
auto
sorted_ids_of(const std::vector<tao::json::value>& documents) -> std::vector<std::string>;
} // namespace test::utils
