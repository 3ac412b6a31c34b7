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

#include "checkpoint_store.hxx"

#include "core/logger/logger.hxx"
#include "core/utils/json.hxx"

#include <fluentdb/error_codes.hxx>

#include <gsl/util>
#include <tao/json/value.hpp>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <utility>

namespace fluentdb::core
{
auto
memory_checkpoint_store::load(const std::string& partition_key_range_id)
  -> tl::expected<std::optional<std::string>, std::error_code>
{
  const std::scoped_lock lock(mutex_);
  if (auto it = tokens_.find(partition_key_range_id); it != tokens_.end()) {
    return it->second;
  }
  return std::optional<std::string>{};
}

auto
memory_checkpoint_store::save(const std::string& partition_key_range_id, const std::string& token)
  -> std::error_code
{
  const std::scoped_lock lock(mutex_);
  tokens_[partition_key_range_id] = token;
  return {};
}

auto
memory_checkpoint_store::erase(const std::string& partition_key_range_id) -> std::error_code
{
  const std::scoped_lock lock(mutex_);
  tokens_.erase(partition_key_range_id);
  return {};
}

auto
memory_checkpoint_store::range_ids() -> tl::expected<std::vector<std::string>, std::error_code>
{
  const std::scoped_lock lock(mutex_);
  std::vector<std::string> ids;
  ids.reserve(tokens_.size());
  for (const auto& [id, token] : tokens_) {
    ids.emplace_back(id);
  }
  return ids;
}

file_checkpoint_store::file_checkpoint_store(std::string path)
  : path_{ std::move(path) }
{
}

auto
file_checkpoint_store::path() const -> const std::string&
{
  return path_;
}

auto
file_checkpoint_store::ensure_loaded() -> std::error_code
{
  if (tokens_) {
    return {};
  }

  std::error_code ec;
  if (!std::filesystem::exists(path_, ec)) {
    if (ec) {
      FLUENTDB_LOG_DEBUG("unable to check checkpoint file \"{}\": {}", path_, ec.message());
      return errc::change_feed::checkpoint_read_failure;
    }
    tokens_.emplace();
    return {};
  }

  std::ifstream input(path_, std::ios::binary);
  if (!input) {
    FLUENTDB_LOG_DEBUG("unable to open checkpoint file \"{}\"", path_);
    return errc::change_feed::checkpoint_read_failure;
  }
  const std::string content{ std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>() };

  std::map<std::string, std::string> tokens;
  try {
    auto json = utils::json::parse(content);
    if (!json.is_object()) {
      FLUENTDB_LOG_WARNING("checkpoint file \"{}\" does not contain a JSON object", path_);
      return errc::change_feed::checkpoint_read_failure;
    }
    for (const auto& [range_id, token] : json.get_object()) {
      if (!token.is_string()) {
        FLUENTDB_LOG_WARNING(
          "checkpoint file \"{}\" has non-string token for range \"{}\"", path_, range_id);
        return errc::change_feed::checkpoint_read_failure;
      }
      tokens.try_emplace(range_id, token.get_string());
    }
  } catch (const std::exception& e) {
    FLUENTDB_LOG_WARNING("unable to parse checkpoint file \"{}\": {}", path_, e.what());
    return errc::change_feed::checkpoint_read_failure;
  }

  FLUENTDB_LOG_DEBUG("loaded {} checkpoint(s) from \"{}\"", tokens.size(), path_);
  tokens_ = std::move(tokens);
  return {};
}

auto
file_checkpoint_store::persist(const std::map<std::string, std::string>& tokens) -> std::error_code
{
  tao::json::value json = tao::json::empty_object;
  for (const auto& [range_id, token] : tokens) {
    json[range_id] = token;
  }

  const std::filesystem::path target{ path_ };
  std::error_code ec;
  if (target.has_parent_path()) {
    std::filesystem::create_directories(target.parent_path(), ec);
    if (ec) {
      FLUENTDB_LOG_DEBUG("unable to create directory for checkpoint file \"{}\": {}", path_, ec.message());
      return errc::change_feed::checkpoint_write_failure;
    }
  }

  auto temporary = target;
  temporary += ".tmp";
  bool renamed{ false };
  auto cleanup = gsl::finally([&temporary, &renamed]() {
    if (!renamed) {
      std::error_code ignored;
      std::filesystem::remove(temporary, ignored);
    }
  });

  {
    std::ofstream output(temporary, std::ios::binary | std::ios::trunc);
    output << utils::json::generate_pretty(json);
    output.flush();
    if (!output) {
      FLUENTDB_LOG_DEBUG("unable to write checkpoint file \"{}\"", temporary.string());
      return errc::change_feed::checkpoint_write_failure;
    }
  }

  std::filesystem::rename(temporary, target, ec);
  if (ec) {
    FLUENTDB_LOG_DEBUG("unable to replace checkpoint file \"{}\": {}", path_, ec.message());
    return errc::change_feed::checkpoint_write_failure;
  }
  renamed = true;
  return {};
}

auto
file_checkpoint_store::load(const std::string& partition_key_range_id)
  -> tl::expected<std::optional<std::string>, std::error_code>
{
  const std::scoped_lock lock(mutex_);
  if (auto ec = ensure_loaded(); ec) {
    return tl::unexpected(ec);
  }
  if (auto it = tokens_->find(partition_key_range_id); it != tokens_->end()) {
    return it->second;
  }
  return std::optional<std::string>{};
}

auto
file_checkpoint_store::save(const std::string& partition_key_range_id, const std::string& token)
  -> std::error_code
{
  const std::scoped_lock lock(mutex_);
  if (auto ec = ensure_loaded(); ec) {
    return ec;
  }
  auto tokens = tokens_.value();
  tokens[partition_key_range_id] = token;
  if (auto ec = persist(tokens); ec) {
    return ec;
  }
  tokens_ = std::move(tokens);
  return {};
}

auto
file_checkpoint_store::erase(const std::string& partition_key_range_id) -> std::error_code
{
  const std::scoped_lock lock(mutex_);
  if (auto ec = ensure_loaded(); ec) {
    return ec;
  }
  if (tokens_->count(partition_key_range_id) == 0) {
    return {};
  }
  auto tokens = tokens_.value();
  tokens.erase(partition_key_range_id);
  if (auto ec = persist(tokens); ec) {
    return ec;
  }
  tokens_ = std::move(tokens);
  return {};
}

auto
file_checkpoint_store::range_ids() -> tl::expected<std::vector<std::string>, std::error_code>
{
  const std::scoped_lock lock(mutex_);
  if (auto ec = ensure_loaded(); ec) {
    return tl::unexpected(ec);
  }
  std::vector<std::string> ids;
  ids.reserve(tokens_->size());
  for (const auto& [id, token] : tokens_.value()) {
    ids.emplace_back(id);
  }
  return ids;
}
} // namespace fluentdb::core
