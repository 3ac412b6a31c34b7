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

#include "change_feed_reader.hxx"

#include "core/checkpoint_store.hxx"
#include "core/logger/logger.hxx"

#include <fluentdb/error_codes.hxx>

#include <asio/error.hpp>
#include <asio/io_context.hpp>
#include <asio/post.hpp>
#include <asio/steady_timer.hpp>

#include <algorithm>
#include <deque>
#include <future>
#include <mutex>
#include <set>
#include <string>
#include <utility>

namespace fluentdb::core
{
class change_feed_read_operation : public std::enable_shared_from_this<change_feed_read_operation>
{
public:
  change_feed_read_operation(asio::io_context& io,
                             std::shared_ptr<document_store> store,
                             collection_link link,
                             std::shared_ptr<checkpoint_store> checkpoints,
                             change_feed_reader_options options,
                             change_feed_read_options read_options,
                             change_feed_read_handler&& handler,
                             utils::movable_function<void(const change_feed_read_operation*)>&& on_complete)
    : io_{ io }
    , store_{ std::move(store) }
    , link_{ std::move(link) }
    , checkpoints_{ std::move(checkpoints) }
    , options_{ options }
    , timeout_{ read_options.timeout }
    , on_page_{ std::move(read_options.on_page) }
    , deadline_{ io }
    , handler_{ std::move(handler) }
    , on_complete_{ std::move(on_complete) }
  {
  }

  /// Must be called once, before the operation is started.
  void arm_deadline()
  {
    if (!timeout_) {
      return;
    }
    deadline_.expires_after(timeout_.value());
    deadline_.async_wait([self = shared_from_this()](std::error_code ec) {
      if (ec == asio::error::operation_aborted) {
        return;
      }
      FLUENTDB_LOG_DEBUG("reading changes of \"{}\" did not complete in {}ms",
                         self->link_.to_string(),
                         self->timeout_->count());
      self->finish(errc::common::ambiguous_timeout);
    });
  }

  void start()
  {
    asio::post(io_, [self = shared_from_this()]() {
      if (self->finished_) {
        return;
      }
      if (self->options_.page_size == 0) {
        return self->finish(errc::change_feed::invalid_page_size);
      }
      FLUENTDB_LOG_TRACE("reading changes of \"{}\", page_size={}",
                         self->link_.to_string(),
                         self->options_.page_size);
      self->list_ranges({});
    });
  }

  void cancel()
  {
    asio::post(io_, [self = shared_from_this()]() {
      self->finish(errc::common::request_canceled);
    });
  }

  /// Fails a queued operation without starting it.
  void abandon(std::error_code ec)
  {
    asio::post(io_, [self = shared_from_this(), ec]() {
      self->on_complete_ = nullptr;
      self->finish(ec);
    });
  }

private:
  void list_ranges(std::optional<std::string> continuation_token)
  {
    if (finished_) {
      return;
    }
    if (++range_pages_ > options_.max_partition_range_pages) {
      FLUENTDB_LOG_WARNING(
        "listing partition key ranges of \"{}\" did not terminate after {} pages",
        link_.to_string(),
        options_.max_partition_range_pages);
      return finish(errc::change_feed::partition_range_listing_not_terminated);
    }

    store_->list_partition_ranges(
      link_,
      std::move(continuation_token),
      [self = shared_from_this()](std::error_code ec, partition_range_page page) mutable {
        asio::post(self->io_, [self, ec, page = std::move(page)]() mutable {
          self->on_range_page(ec, std::move(page));
        });
      });
  }

  void on_range_page(std::error_code ec, partition_range_page page)
  {
    if (finished_) {
      return;
    }
    if (ec) {
      FLUENTDB_LOG_DEBUG("unable to list partition key ranges of \"{}\": {}",
                         link_.to_string(),
                         ec.message());
      return finish(ec);
    }
    for (auto& range : page.ranges) {
      ranges_.emplace_back(std::move(range));
    }
    if (page.continuation_token) {
      return list_ranges(std::move(page.continuation_token));
    }

    FLUENTDB_LOG_DEBUG("collection \"{}\" has {} partition key range(s)",
                       link_.to_string(),
                       ranges_.size());
    if (options_.prune_orphaned_checkpoints) {
      if (auto prune_ec = prune_orphaned_checkpoints(); prune_ec) {
        return finish(prune_ec);
      }
    }
    start_range();
  }

  auto prune_orphaned_checkpoints() -> std::error_code
  {
    auto stored = checkpoints_->range_ids();
    if (!stored) {
      return stored.error();
    }
    std::set<std::string> current;
    for (const auto& range : ranges_) {
      current.insert(range.id);
    }
    for (const auto& range_id : stored.value()) {
      if (current.count(range_id) > 0) {
        continue;
      }
      FLUENTDB_LOG_DEBUG("erasing checkpoint of orphaned partition key range \"{}\" of \"{}\"",
                         range_id,
                         link_.to_string());
      if (auto ec = checkpoints_->erase(range_id); ec) {
        return ec;
      }
    }
    return {};
  }

  void start_range()
  {
    if (finished_) {
      return;
    }
    if (range_index_ == ranges_.size()) {
      FLUENTDB_LOG_DEBUG("read {} changed document(s) from \"{}\"",
                         results_.size(),
                         link_.to_string());
      return finish({});
    }

    const auto& range_id = ranges_[range_index_].id;
    auto token = checkpoints_->load(range_id);
    if (!token) {
      FLUENTDB_LOG_DEBUG("unable to load checkpoint of partition key range \"{}\" of \"{}\": {}",
                         range_id,
                         link_.to_string(),
                         token.error().message());
      return finish(token.error(), range_id);
    }

    FLUENTDB_LOG_TRACE("draining partition key range \"{}\" of \"{}\" from {}",
                       range_id,
                       link_.to_string(),
                       token.value().value_or("the beginning"));
    change_feed_request request{
      link_, range_id, token.value(), !token.value().has_value(), options_.page_size,
    };
    cursor_ = store_->open_change_feed(std::move(request));
    if (!cursor_) {
      return finish(errc::common::service_not_available, range_id);
    }
    drain();
  }

  void drain()
  {
    if (finished_) {
      return;
    }
    if (!cursor_->has_more()) {
      FLUENTDB_LOG_TRACE("partition key range \"{}\" of \"{}\" is drained",
                         ranges_[range_index_].id,
                         link_.to_string());
      cursor_.reset();
      ++range_index_;
      return asio::post(io_, [self = shared_from_this()]() {
        self->start_range();
      });
    }

    cursor_->next_page([self = shared_from_this()](std::error_code ec, change_feed_page page) mutable {
      asio::post(self->io_, [self, ec, page = std::move(page)]() mutable {
        self->on_change_feed_page(ec, std::move(page));
      });
    });
  }

  void on_change_feed_page(std::error_code ec, change_feed_page page)
  {
    if (finished_) {
      return;
    }
    const auto& range_id = ranges_[range_index_].id;
    if (ec) {
      FLUENTDB_LOG_DEBUG("unable to read change feed of partition key range \"{}\" of \"{}\": {}",
                         range_id,
                         link_.to_string(),
                         ec.message());
      return finish(ec, range_id);
    }
    if (on_page_) {
      if (auto page_ec = on_page_(page.documents); page_ec) {
        FLUENTDB_LOG_DEBUG("page of partition key range \"{}\" of \"{}\" was rejected: {}",
                           range_id,
                           link_.to_string(),
                           page_ec.message());
        return finish(page_ec, range_id);
      }
    }

    // appending the page and storing its token must not be separated
    for (auto& document : page.documents) {
      results_.emplace_back(std::move(document));
    }
    if (auto save_ec = checkpoints_->save(range_id, page.continuation_token); save_ec) {
      FLUENTDB_LOG_DEBUG("unable to store checkpoint \"{}\" of partition key range \"{}\": {}",
                         page.continuation_token,
                         range_id,
                         save_ec.message());
      return finish(save_ec, range_id);
    }

    asio::post(io_, [self = shared_from_this()]() {
      self->drain();
    });
  }

  void finish(std::error_code ec, std::optional<std::string> partition_key_range_id = {})
  {
    if (finished_) {
      return;
    }
    finished_ = true;
    deadline_.cancel();
    cursor_.reset();

    if (ec) {
      results_.clear();
    }
    if (!ec) {
      partition_key_range_id.reset();
    }
    auto handler = std::move(handler_);
    auto on_complete = std::move(on_complete_);
    handler({ ec, std::move(partition_key_range_id) }, std::move(results_));
    if (on_complete) {
      on_complete(this);
    }
  }

  asio::io_context& io_;
  std::shared_ptr<document_store> store_;
  collection_link link_;
  std::shared_ptr<checkpoint_store> checkpoints_;
  change_feed_reader_options options_;
  std::optional<std::chrono::milliseconds> timeout_;
  change_feed_page_hook on_page_;
  asio::steady_timer deadline_;
  change_feed_read_handler handler_;
  utils::movable_function<void(const change_feed_read_operation*)> on_complete_;

  std::size_t range_pages_{ 0 };
  std::vector<partition_key_range> ranges_{};
  std::size_t range_index_{ 0 };
  std::shared_ptr<change_feed_cursor> cursor_{};
  std::vector<tao::json::value> results_{};
  bool finished_{ false };
};

class change_feed_reader_impl : public std::enable_shared_from_this<change_feed_reader_impl>
{
public:
  change_feed_reader_impl(asio::io_context& io,
                          std::shared_ptr<document_store> store,
                          collection_link link,
                          std::shared_ptr<checkpoint_store> checkpoints,
                          change_feed_reader_options options)
    : io_{ io }
    , store_{ std::move(store) }
    , link_{ std::move(link) }
    , checkpoints_{ std::move(checkpoints) }
    , options_{ options }
  {
  }

  [[nodiscard]] auto link() const -> const collection_link&
  {
    return link_;
  }

  [[nodiscard]] auto checkpoints() const -> std::shared_ptr<checkpoint_store>
  {
    return checkpoints_;
  }

  void read(const change_feed_read_options& read_options, change_feed_read_handler&& handler)
  {
    auto options = options_;
    if (read_options.page_size) {
      options.page_size = read_options.page_size.value();
    }
    auto operation = std::make_shared<change_feed_read_operation>(
      io_,
      store_,
      link_,
      checkpoints_,
      options,
      read_options,
      std::move(handler),
      [self = shared_from_this()](const change_feed_read_operation* completed) {
        self->operation_completed(completed);
      });

    {
      // armed under the lock, so an expired deadline finds the operation queued or current
      const std::scoped_lock lock(mutex_);
      operation->arm_deadline();
      if (current_) {
        FLUENTDB_LOG_TRACE("another read of \"{}\" is in flight, queueing ({} waiting)",
                           link_.to_string(),
                           pending_.size());
        pending_.emplace_back(std::move(operation));
        return;
      }
      current_ = operation;
    }
    operation->start();
  }

  void cancel()
  {
    std::shared_ptr<change_feed_read_operation> current;
    std::deque<std::shared_ptr<change_feed_read_operation>> pending;
    {
      const std::scoped_lock lock(mutex_);
      current = current_;
      std::swap(pending, pending_);
    }
    for (const auto& operation : pending) {
      operation->abandon(errc::common::request_canceled);
    }
    if (current) {
      current->cancel();
    }
  }

  auto reset_checkpoints() -> std::error_code
  {
    auto ids = checkpoints_->range_ids();
    if (!ids) {
      return ids.error();
    }
    for (const auto& range_id : ids.value()) {
      if (auto ec = checkpoints_->erase(range_id); ec) {
        return ec;
      }
    }
    FLUENTDB_LOG_DEBUG("erased {} checkpoint(s) of \"{}\"", ids->size(), link_.to_string());
    return {};
  }

private:
  void operation_completed(const change_feed_read_operation* operation)
  {
    std::shared_ptr<change_feed_read_operation> next;
    {
      const std::scoped_lock lock(mutex_);
      if (current_.get() != operation) {
        // timed out while queued
        pending_.erase(std::remove_if(pending_.begin(),
                                      pending_.end(),
                                      [operation](const auto& queued) {
                                        return queued.get() == operation;
                                      }),
                       pending_.end());
        return;
      }
      current_.reset();
      if (pending_.empty()) {
        return;
      }
      next = pending_.front();
      pending_.pop_front();
      current_ = next;
    }
    next->start();
  }

  asio::io_context& io_;
  std::shared_ptr<document_store> store_;
  collection_link link_;
  std::shared_ptr<checkpoint_store> checkpoints_;
  change_feed_reader_options options_;

  std::mutex mutex_{};
  std::shared_ptr<change_feed_read_operation> current_{};
  std::deque<std::shared_ptr<change_feed_read_operation>> pending_{};
};

change_feed_reader::change_feed_reader(asio::io_context& io,
                                       std::shared_ptr<document_store> store,
                                       collection_link link,
                                       std::shared_ptr<checkpoint_store> checkpoints,
                                       change_feed_reader_options options)
  : impl_{ std::make_shared<change_feed_reader_impl>(io,
                                                     std::move(store),
                                                     std::move(link),
                                                     std::move(checkpoints),
                                                     options) }
{
}

auto
change_feed_reader::link() const -> const collection_link&
{
  return impl_->link();
}

auto
change_feed_reader::checkpoints() const -> std::shared_ptr<checkpoint_store>
{
  return impl_->checkpoints();
}

auto
change_feed_reader::read(const change_feed_read_options& options)
  -> tl::expected<std::vector<tao::json::value>, std::error_code>
{
  auto barrier =
    std::make_shared<std::promise<tl::expected<std::vector<tao::json::value>, std::error_code>>>();
  auto f = barrier->get_future();
  read(options, [barrier](change_feed_read_error err, std::vector<tao::json::value> documents) mutable {
    if (err.ec) {
      return barrier->set_value(tl::unexpected(err.ec));
    }
    barrier->set_value(std::move(documents));
  });
  return f.get();
}

void
change_feed_reader::read(const change_feed_read_options& options,
                         change_feed_read_handler&& handler)
{
  return impl_->read(options, std::move(handler));
}

void
change_feed_reader::cancel()
{
  return impl_->cancel();
}

auto
change_feed_reader::reset_checkpoints() -> std::error_code
{
  return impl_->reset_checkpoints();
}
} // namespace fluentdb::core
