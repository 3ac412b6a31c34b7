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

#include <tl/expected.hpp>

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace fluentdb::core
{
/**
 * Keeps the last resumption token consumed for each partition key range of one collection.
 *
 * At most one token is stored per range. A range without a token is read from the beginning.
 */
class checkpoint_store
{
public:
  virtual ~checkpoint_store() = default;

  [[nodiscard]] virtual auto load(const std::string& partition_key_range_id)
    -> tl::expected<std::optional<std::string>, std::error_code> = 0;
  [[nodiscard]] virtual auto save(const std::string& partition_key_range_id,
                                  const std::string& token) -> std::error_code = 0;
  [[nodiscard]] virtual auto erase(const std::string& partition_key_range_id) -> std::error_code = 0;
  [[nodiscard]] virtual auto range_ids() -> tl::expected<std::vector<std::string>, std::error_code> = 0;
};

class memory_checkpoint_store : public checkpoint_store
{
public:
  [[nodiscard]] auto load(const std::string& partition_key_range_id)
    -> tl::expected<std::optional<std::string>, std::error_code> override;
  [[nodiscard]] auto save(const std::string& partition_key_range_id, const std::string& token)
    -> std::error_code override;
  [[nodiscard]] auto erase(const std::string& partition_key_range_id) -> std::error_code override;
  [[nodiscard]] auto range_ids() -> tl::expected<std::vector<std::string>, std::error_code> override;

private:
  std::mutex mutex_{};
  std::map<std::string, std::string> tokens_{};
};

/**
 * Durable checkpoints: a JSON object mapping range identifiers to tokens, rewritten atomically
 * (temporary file and rename) on every change.
 */
class file_checkpoint_store : public checkpoint_store
{
public:
  explicit file_checkpoint_store(std::string path);

  [[nodiscard]] auto path() const -> const std::string&;

  [[nodiscard]] auto load(const std::string& partition_key_range_id)
    -> tl::expected<std::optional<std::string>, std::error_code> override;
  [[nodiscard]] auto save(const std::string& partition_key_range_id, const std::string& token)
    -> std::error_code override;
  [[nodiscard]] auto erase(const std::string& partition_key_range_id) -> std::error_code override;
  [[nodiscard]] auto range_ids() -> tl::expected<std::vector<std::string>, std::error_code> override;

private:
  auto ensure_loaded() -> std::error_code;
  auto persist(const std::map<std::string, std::string>& tokens) -> std::error_code;

  std::string path_;
  std::mutex mutex_{};
  std::optional<std::map<std::string, std::string>> tokens_{};
};
} // namespace fluentdb::core
