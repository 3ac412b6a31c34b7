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

#include <fluentdb/database.hxx>

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <system_error>

namespace fluentdb
{
class instance_impl;

class database_impl : public std::enable_shared_from_this<database_impl>
{
public:
  database_impl(std::shared_ptr<instance_impl> instance, std::string id);

  [[nodiscard]] auto id() const -> const std::string&;
  [[nodiscard]] auto instance() const -> const std::shared_ptr<instance_impl>&;

  /**
   * Creates the database unless it is known to exist.
   */
  void ensure(core::utils::movable_function<void(std::error_code)>&& handler);

  [[nodiscard]] auto make_collection(std::string collection_id) -> fluentdb::collection;

  void add_collection(std::string collection_id, collection_properties_handler&& handler);
  void collections(collection_properties_list_handler&& handler);
  void read(database_properties_handler&& handler);
  void remove(status_handler&& handler);
  void clear(status_handler&& handler);

private:
  std::shared_ptr<instance_impl> instance_;
  std::string id_;
  std::atomic_int64_t ensured_epoch_{ -1 };
};
} // namespace fluentdb
