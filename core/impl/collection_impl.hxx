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

#include "core/change_feed_reader.hxx"
#include "core/document_store.hxx"
#include "core/utils/movable_function.hxx"

#include <fluentdb/collection.hxx>
#include <fluentdb/get_changes_options.hxx>

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

namespace fluentdb
{
namespace core
{
class checkpoint_store;
} // namespace core
class database_impl;

class collection_impl : public std::enable_shared_from_this<collection_impl>
{
public:
  collection_impl(std::shared_ptr<database_impl> database,
                  std::string id,
                  std::shared_ptr<core::checkpoint_store> checkpoints);

  [[nodiscard]] auto id() const -> const std::string&;
  [[nodiscard]] auto database_id() const -> const std::string&;
  [[nodiscard]] auto link() const -> const core::collection_link&;
  [[nodiscard]] auto database() const -> const std::shared_ptr<database_impl>&;

  /**
   * Creates the database and the collection unless they are known to exist.
   */
  void ensure(core::utils::movable_function<void(std::error_code)>&& handler);

  void add(tao::json::value document, document_handler&& handler);
  void add(std::vector<tao::json::value> documents, document_list_handler&& handler);
  void get(std::string document_id, document_handler&& handler);
  void upsert(tao::json::value document, document_handler&& handler);
  void remove(std::string document_id, status_handler&& handler);
  void query(document_list_handler&& handler);
  void get_changes(get_changes_options::built options, get_changes_handler&& handler);
  void cancel_get_changes();
  void read(collection_properties_handler&& handler);
  void remove(status_handler&& handler);
  void clear(status_handler&& handler);

private:
  std::shared_ptr<database_impl> database_;
  std::string id_;
  core::collection_link link_;
  core::change_feed_reader reader_;
  std::atomic_int64_t ensured_epoch_{ -1 };
};
} // namespace fluentdb
