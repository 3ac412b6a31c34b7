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

#include "memory_store.hxx"

#include "core/logger/logger.hxx"
#include "core/uuid.hxx"

#include <fluentdb/error_codes.hxx>

#include <asio/io_context.hpp>
#include <asio/post.hpp>
#include <fmt/core.h>

#include <algorithm>
#include <charconv>
#include <chrono>
#include <tuple>

namespace fluentdb::core
{
namespace
{
constexpr std::uint64_t hash_space{ std::uint64_t{ 1 } << 32U };

template<typename Handler, typename... Args>
void
complete(asio::io_context& io, Handler&& handler, Args&&... args)
{
  asio::post(io,
             [handler = std::forward<Handler>(handler),
              args = std::make_tuple(std::forward<Args>(args)...)]() mutable {
               std::apply(handler, std::move(args));
             });
}

// FNV-1a
auto
hash_document_id(const std::string& id) -> std::uint32_t
{
  std::uint32_t hash{ 2166136261U };
  for (auto c : id) {
    hash ^= static_cast<std::uint8_t>(c);
    hash *= 16777619U;
  }
  return hash;
}

auto
parse_number(const std::string& input) -> std::optional<std::uint64_t>
{
  std::uint64_t value{};
  const auto* end = input.data() + input.size();
  auto [ptr, ec] = std::from_chars(input.data(), end, value);
  if (ec != std::errc{} || ptr != end || input.empty()) {
    return {};
  }
  return value;
}

auto
to_partition_key_range(const std::string& id, std::uint64_t min_inclusive, std::uint64_t max_exclusive)
  -> partition_key_range
{
  return { id, fmt::format("{:08X}", min_inclusive), fmt::format("{:08X}", max_exclusive) };
}
} // namespace

class memory_change_feed_cursor : public change_feed_cursor
{
public:
  memory_change_feed_cursor(asio::io_context& io,
                            std::shared_ptr<memory_store> store,
                            change_feed_request request)
    : io_{ io }
    , store_{ std::move(store) }
    , request_{ std::move(request) }
    , token_{ request_.continuation_token }
  {
  }

  [[nodiscard]] auto has_more() const -> bool override
  {
    const std::scoped_lock lock(mutex_);
    return has_more_;
  }

  void next_page(change_feed_page_handler&& handler) override
  {
    std::error_code ec;
    change_feed_page page;
    {
      const std::scoped_lock lock(mutex_);
      auto [next, more] = store_->next_changes(request_, token_, ec);
      if (!ec) {
        token_ = next.continuation_token;
        has_more_ = more;
        page = std::move(next);
      }
    }
    complete(io_, std::move(handler), ec, std::move(page));
  }

private:
  asio::io_context& io_;
  std::shared_ptr<memory_store> store_;
  change_feed_request request_;
  std::optional<std::string> token_;
  bool has_more_{ true };
  mutable std::mutex mutex_{};
};

memory_store::memory_store(asio::io_context& io, memory_store_options options)
  : io_{ io }
  , options_{ options }
{
  if (options_.partition_count == 0) {
    options_.partition_count = 1;
  }
  if (options_.range_page_size == 0) {
    options_.range_page_size = 1;
  }
}

auto
memory_store::options() const -> const memory_store_options&
{
  return options_;
}

auto
memory_store::next_resource_id() -> std::string
{
  return fmt::format("{:012x}", ++resource_counter_);
}

auto
memory_store::find_collection(const collection_link& link, std::error_code& ec) -> collection_state*
{
  auto db = databases_.find(link.database_id);
  if (db == databases_.end()) {
    ec = errc::document_store::database_not_found;
    return nullptr;
  }
  auto coll = db->second.collections.find(link.collection_id);
  if (coll == db->second.collections.end()) {
    ec = errc::document_store::collection_not_found;
    return nullptr;
  }
  return &coll->second;
}

void
memory_store::create_database(std::string database_id, bool if_not_exists, database_handler&& handler)
{
  if (database_id.empty()) {
    return complete(io_, std::move(handler), std::error_code{ errc::common::invalid_argument }, database_properties{});
  }

  std::error_code ec;
  database_properties properties;
  {
    const std::scoped_lock lock(mutex_);
    if (auto it = databases_.find(database_id); it != databases_.end()) {
      if (if_not_exists) {
        properties = it->second.properties;
      } else {
        ec = errc::document_store::database_exists;
      }
    } else {
      auto rid = next_resource_id();
      properties = { database_id, rid, fmt::format("\"{}\"", rid) };
      databases_.try_emplace(database_id, database_state{ properties });
      FLUENTDB_LOG_DEBUG("created database \"{}\"", database_id);
    }
  }
  complete(io_, std::move(handler), ec, std::move(properties));
}

void
memory_store::read_database(std::string database_id, database_handler&& handler)
{
  std::error_code ec;
  database_properties properties;
  {
    const std::scoped_lock lock(mutex_);
    if (auto it = databases_.find(database_id); it != databases_.end()) {
      properties = it->second.properties;
    } else {
      ec = errc::document_store::database_not_found;
    }
  }
  complete(io_, std::move(handler), ec, std::move(properties));
}

void
memory_store::delete_database(std::string database_id, status_handler&& handler)
{
  std::error_code ec;
  {
    const std::scoped_lock lock(mutex_);
    if (databases_.erase(database_id) == 0) {
      ec = errc::document_store::database_not_found;
    } else {
      FLUENTDB_LOG_DEBUG("deleted database \"{}\"", database_id);
    }
  }
  complete(io_, std::move(handler), ec);
}

void
memory_store::list_databases(database_list_handler&& handler)
{
  std::vector<database_properties> result;
  {
    const std::scoped_lock lock(mutex_);
    for (const auto& [id, db] : databases_) {
      result.emplace_back(db.properties);
    }
  }
  complete(io_, std::move(handler), std::error_code{}, std::move(result));
}

void
memory_store::create_collection(collection_link link, bool if_not_exists, collection_handler&& handler)
{
  if (link.collection_id.empty()) {
    return complete(io_, std::move(handler), std::error_code{ errc::common::invalid_argument }, collection_properties{});
  }

  std::error_code ec;
  collection_properties properties;
  {
    const std::scoped_lock lock(mutex_);
    auto db = databases_.find(link.database_id);
    if (db == databases_.end()) {
      ec = errc::document_store::database_not_found;
    } else if (auto it = db->second.collections.find(link.collection_id); it != db->second.collections.end()) {
      if (if_not_exists) {
        properties = it->second.properties;
      } else {
        ec = errc::document_store::collection_exists;
      }
    } else {
      collection_state state;
      auto rid = next_resource_id();
      const auto count = options_.partition_count;
      const auto span = hash_space / count;
      for (std::size_t i = 0; i < count; ++i) {
        const auto max = (i + 1 == count) ? hash_space : (i + 1) * span;
        state.ranges.push_back({ std::to_string(state.next_range_id++), i * span, max });
      }
      state.properties = { link.collection_id, link.database_id, rid, fmt::format("\"{}\"", rid), count };
      properties = state.properties;
      db->second.collections.try_emplace(link.collection_id, std::move(state));
      FLUENTDB_LOG_DEBUG("created collection \"{}\" with {} partition key range(s)", link.to_string(), count);
    }
  }
  complete(io_, std::move(handler), ec, std::move(properties));
}

void
memory_store::read_collection(collection_link link, collection_handler&& handler)
{
  std::error_code ec;
  collection_properties properties;
  {
    const std::scoped_lock lock(mutex_);
    if (const auto* coll = find_collection(link, ec); coll != nullptr) {
      properties = coll->properties;
    }
  }
  complete(io_, std::move(handler), ec, std::move(properties));
}

void
memory_store::delete_collection(collection_link link, status_handler&& handler)
{
  std::error_code ec;
  {
    const std::scoped_lock lock(mutex_);
    if (find_collection(link, ec) != nullptr) {
      databases_[link.database_id].collections.erase(link.collection_id);
      FLUENTDB_LOG_DEBUG("deleted collection \"{}\"", link.to_string());
    }
  }
  complete(io_, std::move(handler), ec);
}

void
memory_store::list_collections(std::string database_id, collection_list_handler&& handler)
{
  std::error_code ec;
  std::vector<collection_properties> result;
  {
    const std::scoped_lock lock(mutex_);
    if (auto db = databases_.find(database_id); db != databases_.end()) {
      for (const auto& [id, coll] : db->second.collections) {
        result.emplace_back(coll.properties);
      }
    } else {
      ec = errc::document_store::database_not_found;
    }
  }
  complete(io_, std::move(handler), ec, std::move(result));
}

auto
memory_store::write_document(const collection_link& link,
                             tao::json::value document,
                             bool upsert,
                             std::error_code& ec) -> tao::json::value
{
  if (!document.is_object()) {
    ec = errc::common::invalid_argument;
    return {};
  }

  std::string id;
  if (const auto* member = document.find("id"); member != nullptr && !member->is_null()) {
    if (!member->is_string()) {
      ec = errc::common::invalid_argument;
      return {};
    }
    id = member->get_string();
  }
  if (id.empty()) {
    id = uuid::to_string(uuid::random());
    document["id"] = id;
  }

  auto* coll = find_collection(link, ec);
  if (coll == nullptr) {
    return {};
  }
  auto existing = coll->documents.find(id);
  if (existing != coll->documents.end() && !upsert) {
    ec = errc::document_store::document_exists;
    return {};
  }

  const auto lsn = ++coll->lsn;
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  document["_rid"] = next_resource_id();
  document["_etag"] = fmt::format("\"{:016x}\"", lsn);
  document["_ts"] = std::chrono::duration_cast<std::chrono::seconds>(now).count();
  document["_lsn"] = lsn;

  if (existing != coll->documents.end()) {
    existing->second.body = document;
    existing->second.lsn = lsn;
  } else {
    coll->documents.try_emplace(id, stored_document{ document, lsn, hash_document_id(id) });
  }
  FLUENTDB_LOG_TRACE("stored document \"{}\" in \"{}\", lsn={}", id, link.to_string(), lsn);
  return document;
}

void
memory_store::create_document(collection_link link, tao::json::value document, document_handler&& handler)
{
  std::error_code ec;
  tao::json::value result;
  {
    const std::scoped_lock lock(mutex_);
    result = write_document(link, std::move(document), false, ec);
  }
  complete(io_, std::move(handler), ec, std::move(result));
}

void
memory_store::upsert_document(collection_link link, tao::json::value document, document_handler&& handler)
{
  std::error_code ec;
  tao::json::value result;
  {
    const std::scoped_lock lock(mutex_);
    result = write_document(link, std::move(document), true, ec);
  }
  complete(io_, std::move(handler), ec, std::move(result));
}

void
memory_store::read_document(collection_link link, std::string document_id, document_handler&& handler)
{
  std::error_code ec;
  tao::json::value result;
  {
    const std::scoped_lock lock(mutex_);
    if (const auto* coll = find_collection(link, ec); coll != nullptr) {
      if (auto it = coll->documents.find(document_id); it != coll->documents.end()) {
        result = it->second.body;
      } else {
        ec = errc::document_store::document_not_found;
      }
    }
  }
  complete(io_, std::move(handler), ec, std::move(result));
}

void
memory_store::delete_document(collection_link link, std::string document_id, status_handler&& handler)
{
  std::error_code ec;
  {
    const std::scoped_lock lock(mutex_);
    if (auto* coll = find_collection(link, ec); coll != nullptr) {
      if (coll->documents.erase(document_id) == 0) {
        ec = errc::document_store::document_not_found;
      } else {
        ++coll->lsn;
      }
    }
  }
  complete(io_, std::move(handler), ec);
}

void
memory_store::list_documents(collection_link link, document_list_handler&& handler)
{
  std::error_code ec;
  std::vector<tao::json::value> result;
  {
    const std::scoped_lock lock(mutex_);
    if (const auto* coll = find_collection(link, ec); coll != nullptr) {
      result.reserve(coll->documents.size());
      for (const auto& [id, document] : coll->documents) {
        result.emplace_back(document.body);
      }
    }
  }
  complete(io_, std::move(handler), ec, std::move(result));
}

void
memory_store::list_partition_ranges(collection_link link,
                                    std::optional<std::string> continuation_token,
                                    partition_range_page_handler&& handler)
{
  std::error_code ec;
  partition_range_page page;
  {
    const std::scoped_lock lock(mutex_);
    std::uint64_t offset{ 0 };
    if (continuation_token) {
      if (auto parsed = parse_number(continuation_token.value()); parsed) {
        offset = parsed.value();
      } else {
        ec = errc::common::invalid_argument;
      }
    }
    if (const auto* coll = ec ? nullptr : find_collection(link, ec); coll != nullptr) {
      const auto end = std::min<std::uint64_t>(coll->ranges.size(), offset + options_.range_page_size);
      for (auto i = offset; i < end; ++i) {
        const auto& range = coll->ranges[i];
        page.ranges.emplace_back(to_partition_key_range(range.id, range.min_inclusive, range.max_exclusive));
      }
      if (end < coll->ranges.size()) {
        page.continuation_token = std::to_string(end);
      }
    }
  }
  complete(io_, std::move(handler), ec, std::move(page));
}

auto
memory_store::next_changes(const change_feed_request& request,
                           const std::optional<std::string>& token,
                           std::error_code& ec) -> std::pair<change_feed_page, bool>
{
  const std::scoped_lock lock(mutex_);
  const auto* coll = find_collection(request.link, ec);
  if (coll == nullptr) {
    return {};
  }
  auto range = std::find_if(coll->ranges.begin(), coll->ranges.end(), [&request](const auto& r) {
    return r.id == request.partition_key_range_id;
  });
  if (range == coll->ranges.end()) {
    ec = errc::document_store::partition_range_gone;
    return {};
  }

  std::uint64_t from{ 0 };
  if (token) {
    auto parsed = parse_number(token.value());
    if (!parsed) {
      ec = errc::common::invalid_argument;
      return {};
    }
    from = parsed.value();
  } else if (!request.start_from_beginning) {
    from = coll->lsn;
  }

  std::vector<const stored_document*> changes;
  for (const auto& [id, document] : coll->documents) {
    if (document.lsn > from && document.hash >= range->min_inclusive && document.hash < range->max_exclusive) {
      changes.push_back(&document);
    }
  }
  std::sort(changes.begin(), changes.end(), [](const auto* lhs, const auto* rhs) {
    return lhs->lsn < rhs->lsn;
  });

  const auto page_size = std::max<std::size_t>(request.page_size, 1);
  change_feed_page page;
  for (std::size_t i = 0; i < changes.size() && i < page_size; ++i) {
    page.documents.emplace_back(changes[i]->body);
    from = changes[i]->lsn;
  }
  page.continuation_token = std::to_string(from);
  return { std::move(page), changes.size() > page_size };
}

auto
memory_store::open_change_feed(change_feed_request request) -> std::shared_ptr<change_feed_cursor>
{
  return std::make_shared<memory_change_feed_cursor>(io_, shared_from_this(), std::move(request));
}

void
memory_store::split_partition_range(collection_link link, std::string range_id, status_handler&& handler)
{
  std::error_code ec;
  {
    const std::scoped_lock lock(mutex_);
    if (auto* coll = find_collection(link, ec); coll != nullptr) {
      auto range = std::find_if(coll->ranges.begin(), coll->ranges.end(), [&range_id](const auto& r) {
        return r.id == range_id;
      });
      if (range == coll->ranges.end()) {
        ec = errc::document_store::partition_range_gone;
      } else if (range->max_exclusive - range->min_inclusive < 2) {
        ec = errc::common::invalid_argument;
      } else {
        const auto middle = range->min_inclusive + (range->max_exclusive - range->min_inclusive) / 2;
        range_state lower{ std::to_string(coll->next_range_id++), range->min_inclusive, middle };
        range_state upper{ std::to_string(coll->next_range_id++), middle, range->max_exclusive };
        FLUENTDB_LOG_DEBUG("split partition key range \"{}\" of \"{}\" into \"{}\" and \"{}\"",
                           range_id,
                           link.to_string(),
                           lower.id,
                           upper.id);
        range = coll->ranges.erase(range);
        range = coll->ranges.insert(range, std::move(upper));
        coll->ranges.insert(range, std::move(lower));
        coll->properties.partition_key_range_count = coll->ranges.size();
      }
    }
  }
  complete(io_, std::move(handler), ec);
}
} // namespace fluentdb::core
