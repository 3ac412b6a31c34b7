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

#include "collection_impl.hxx"

#include "core/checkpoint_store.hxx"
#include "core/impl/database_impl.hxx"
#include "core/impl/error.hxx"
#include "core/impl/instance_impl.hxx"
#include "core/logger/logger.hxx"

#include <fluentdb/collection.hxx>
#include <fluentdb/error_codes.hxx>

#include <future>
#include <mutex>
#include <utility>

namespace fluentdb
{
namespace
{
auto
reader_options(const instance_options::built& options) -> core::change_feed_reader_options
{
  core::change_feed_reader_options result;
  result.page_size = options.change_feed_page_size;
  result.max_partition_range_pages = options.max_partition_range_pages;
  result.prune_orphaned_checkpoints = options.prune_orphaned_checkpoints;
  return result;
}
} // namespace

collection_impl::collection_impl(std::shared_ptr<database_impl> database,
                                 std::string id,
                                 std::shared_ptr<core::checkpoint_store> checkpoints)
  : database_{ std::move(database) }
  , id_{ std::move(id) }
  , link_{ database_->id(), id_ }
  , reader_{ database_->instance()->io(),
             database_->instance()->store(),
             link_,
             std::move(checkpoints),
             reader_options(database_->instance()->options()) }
{
}

auto
collection_impl::id() const -> const std::string&
{
  return id_;
}

auto
collection_impl::database_id() const -> const std::string&
{
  return database_->id();
}

auto
collection_impl::link() const -> const core::collection_link&
{
  return link_;
}

auto
collection_impl::database() const -> const std::shared_ptr<database_impl>&
{
  return database_;
}

void
collection_impl::ensure(core::utils::movable_function<void(std::error_code)>&& handler)
{
  const auto epoch = static_cast<std::int64_t>(database_->instance()->epoch());
  if (ensured_epoch_ == epoch) {
    return handler({});
  }
  database_->ensure([self = shared_from_this(), epoch, handler = std::move(handler)](std::error_code ec) mutable {
    if (ec) {
      return handler(ec);
    }
    self->database_->instance()->store()->create_collection(
      self->link_,
      true,
      [self, epoch, handler = std::move(handler)](std::error_code ec, collection_properties /* properties */) mutable {
        if (!ec) {
          self->ensured_epoch_ = epoch;
        }
        handler(ec);
      });
  });
}

void
collection_impl::add(tao::json::value document, document_handler&& handler)
{
  ensure([self = shared_from_this(), document = std::move(document), handler = std::move(handler)](
           std::error_code ec) mutable {
    if (ec) {
      return handler(core::impl::make_error({ ec, "add", self->link_.database_id, self->id_ }), {});
    }
    self->database_->instance()->store()->create_document(
      self->link_, std::move(document), [self, handler = std::move(handler)](std::error_code ec, tao::json::value stored) {
        handler(core::impl::make_error({ ec, "add", self->link_.database_id, self->id_ }), std::move(stored));
      });
  });
}

void
collection_impl::add(std::vector<tao::json::value> documents, document_list_handler&& handler)
{
  if (documents.empty()) {
    return handler({}, {});
  }

  struct add_state {
    std::mutex mutex{};
    std::size_t remaining;
    error first_error{};
    std::vector<tao::json::value> results;
    document_list_handler handler;
  };
  auto state = std::make_shared<add_state>();
  state->remaining = documents.size();
  state->results.resize(documents.size());
  state->handler = std::move(handler);
  for (std::size_t i = 0; i < documents.size(); ++i) {
    add(std::move(documents[i]), [state, i](error err, tao::json::value stored) {
      std::unique_lock lock(state->mutex);
      if (err && !state->first_error) {
        state->first_error = std::move(err);
      }
      state->results[i] = std::move(stored);
      if (--state->remaining > 0) {
        return;
      }
      lock.unlock();
      if (state->first_error) {
        return state->handler(std::move(state->first_error), {});
      }
      state->handler({}, std::move(state->results));
    });
  }
}

void
collection_impl::get(std::string document_id, document_handler&& handler)
{
  ensure([self = shared_from_this(), document_id = std::move(document_id), handler = std::move(handler)](
           std::error_code ec) mutable {
    if (ec) {
      return handler(core::impl::make_error({ ec, "get", self->link_.database_id, self->id_, document_id }), {});
    }
    self->database_->instance()->store()->read_document(
      self->link_,
      document_id,
      [self, document_id, handler = std::move(handler)](std::error_code ec, tao::json::value stored) {
        handler(core::impl::make_error({ ec, "get", self->link_.database_id, self->id_, document_id }),
                std::move(stored));
      });
  });
}

void
collection_impl::upsert(tao::json::value document, document_handler&& handler)
{
  ensure([self = shared_from_this(), document = std::move(document), handler = std::move(handler)](
           std::error_code ec) mutable {
    if (ec) {
      return handler(core::impl::make_error({ ec, "upsert", self->link_.database_id, self->id_ }), {});
    }
    self->database_->instance()->store()->upsert_document(
      self->link_, std::move(document), [self, handler = std::move(handler)](std::error_code ec, tao::json::value stored) {
        handler(core::impl::make_error({ ec, "upsert", self->link_.database_id, self->id_ }), std::move(stored));
      });
  });
}

void
collection_impl::remove(std::string document_id, status_handler&& handler)
{
  ensure([self = shared_from_this(), document_id = std::move(document_id), handler = std::move(handler)](
           std::error_code ec) mutable {
    if (ec) {
      return handler(core::impl::make_error({ ec, "remove", self->link_.database_id, self->id_, document_id }));
    }
    self->database_->instance()->store()->delete_document(
      self->link_, document_id, [self, document_id, handler = std::move(handler)](std::error_code ec) {
        handler(core::impl::make_error({ ec, "remove", self->link_.database_id, self->id_, document_id }));
      });
  });
}

void
collection_impl::query(document_list_handler&& handler)
{
  ensure([self = shared_from_this(), handler = std::move(handler)](std::error_code ec) mutable {
    if (ec) {
      return handler(core::impl::make_error({ ec, "query", self->link_.database_id, self->id_ }), {});
    }
    self->database_->instance()->store()->list_documents(
      self->link_, [self, handler = std::move(handler)](std::error_code ec, std::vector<tao::json::value> documents) {
        handler(core::impl::make_error({ ec, "query", self->link_.database_id, self->id_ }), std::move(documents));
      });
  });
}

void
collection_impl::get_changes(get_changes_options::built options, get_changes_handler&& handler)
{
  ensure([self = shared_from_this(), options, handler = std::move(handler)](std::error_code ec) mutable {
    if (ec) {
      return handler(core::impl::make_error({ ec, "get_changes", self->link_.database_id, self->id_ }), {});
    }
    // keeps the error of a rejected page, the reader only carries its code
    auto rejected = std::make_shared<error>();
    core::change_feed_read_options read_options{ options.page_size, options.timeout };
    if (options.on_page) {
      read_options.on_page = [on_page = std::move(options.on_page), rejected](const std::vector<tao::json::value>& page) {
        auto err = on_page(page);
        if (err) {
          *rejected = err;
        }
        return err.ec();
      };
    }
    self->reader_.read(
      read_options,
      [self, rejected, handler = std::move(handler)](core::change_feed_read_error read_err,
                                                     std::vector<tao::json::value> changes) {
        auto err = core::impl::make_error({ read_err.ec,
                                            "get_changes",
                                            self->link_.database_id,
                                            self->id_,
                                            {},
                                            std::move(read_err.partition_key_range_id) });
        if (err && *rejected && rejected->ec() == err.ec()) {
          err = error{ err.ec(), rejected->message(), err.ctx() };
        }
        handler(std::move(err), std::move(changes));
      });
  });
}

void
collection_impl::cancel_get_changes()
{
  reader_.cancel();
}

void
collection_impl::read(collection_properties_handler&& handler)
{
  ensure([self = shared_from_this(), handler = std::move(handler)](std::error_code ec) mutable {
    if (ec) {
      return handler(core::impl::make_error({ ec, "read_collection", self->link_.database_id, self->id_ }), {});
    }
    self->database_->instance()->store()->read_collection(
      self->link_, [self, handler = std::move(handler)](std::error_code ec, collection_properties properties) {
        handler(core::impl::make_error({ ec, "read_collection", self->link_.database_id, self->id_ }),
                std::move(properties));
      });
  });
}

void
collection_impl::remove(status_handler&& handler)
{
  database_->instance()->store()->delete_collection(
    link_, [self = shared_from_this(), handler = std::move(handler)](std::error_code ec) {
      self->database_->instance()->advance_epoch();
      handler(core::impl::make_error({ ec, "remove_collection", self->link_.database_id, self->id_ }));
    });
}

void
collection_impl::clear(status_handler&& handler)
{
  database_->instance()->store()->delete_collection(
    link_, [self = shared_from_this(), handler = std::move(handler)](std::error_code ec) mutable {
      if (ec && ec != errc::document_store::collection_not_found && ec != errc::document_store::database_not_found) {
        return handler(core::impl::make_error({ ec, "clear_collection", self->link_.database_id, self->id_ }));
      }
      self->database_->instance()->advance_epoch();
      if (auto reset_ec = self->reader_.reset_checkpoints(); reset_ec) {
        return handler(core::impl::make_error({ reset_ec, "clear_collection", self->link_.database_id, self->id_ }));
      }
      FLUENTDB_LOG_DEBUG("collection \"{}\" deleted, creating it again", self->link_.to_string());
      self->ensure([self, handler = std::move(handler)](std::error_code ec) {
        handler(core::impl::make_error({ ec, "clear_collection", self->link_.database_id, self->id_ }));
      });
    });
}

collection::collection(std::shared_ptr<collection_impl> impl)
  : impl_{ std::move(impl) }
{
}

auto
collection::id() const -> const std::string&
{
  return impl_->id();
}

auto
collection::database_id() const -> const std::string&
{
  return impl_->database_id();
}

void
collection::add(tao::json::value document, document_handler&& handler) const
{
  return impl_->add(std::move(document), std::move(handler));
}

auto
collection::add(tao::json::value document) const -> std::future<std::pair<error, tao::json::value>>
{
  auto barrier = std::make_shared<std::promise<std::pair<error, tao::json::value>>>();
  auto future = barrier->get_future();
  add(std::move(document), [barrier](auto err, auto stored) {
    barrier->set_value({ std::move(err), std::move(stored) });
  });
  return future;
}

void
collection::add(std::vector<tao::json::value> documents, document_list_handler&& handler) const
{
  return impl_->add(std::move(documents), std::move(handler));
}

auto
collection::add(std::vector<tao::json::value> documents) const
  -> std::future<std::pair<error, std::vector<tao::json::value>>>
{
  auto barrier = std::make_shared<std::promise<std::pair<error, std::vector<tao::json::value>>>>();
  auto future = barrier->get_future();
  add(std::move(documents), [barrier](auto err, auto stored) {
    barrier->set_value({ std::move(err), std::move(stored) });
  });
  return future;
}

void
collection::get(std::string document_id, document_handler&& handler) const
{
  return impl_->get(std::move(document_id), std::move(handler));
}

auto
collection::get(std::string document_id) const -> std::future<std::pair<error, tao::json::value>>
{
  auto barrier = std::make_shared<std::promise<std::pair<error, tao::json::value>>>();
  auto future = barrier->get_future();
  get(std::move(document_id), [barrier](auto err, auto stored) {
    barrier->set_value({ std::move(err), std::move(stored) });
  });
  return future;
}

void
collection::upsert(tao::json::value document, document_handler&& handler) const
{
  return impl_->upsert(std::move(document), std::move(handler));
}

auto
collection::upsert(tao::json::value document) const -> std::future<std::pair<error, tao::json::value>>
{
  auto barrier = std::make_shared<std::promise<std::pair<error, tao::json::value>>>();
  auto future = barrier->get_future();
  upsert(std::move(document), [barrier](auto err, auto stored) {
    barrier->set_value({ std::move(err), std::move(stored) });
  });
  return future;
}

void
collection::remove(std::string document_id, status_handler&& handler) const
{
  return impl_->remove(std::move(document_id), std::move(handler));
}

auto
collection::remove(std::string document_id) const -> std::future<error>
{
  auto barrier = std::make_shared<std::promise<error>>();
  auto future = barrier->get_future();
  remove(std::move(document_id), [barrier](auto err) {
    barrier->set_value(std::move(err));
  });
  return future;
}

void
collection::query(document_list_handler&& handler) const
{
  return impl_->query(std::move(handler));
}

auto
collection::query() const -> std::future<std::pair<error, std::vector<tao::json::value>>>
{
  auto barrier = std::make_shared<std::promise<std::pair<error, std::vector<tao::json::value>>>>();
  auto future = barrier->get_future();
  query([barrier](auto err, auto documents) {
    barrier->set_value({ std::move(err), std::move(documents) });
  });
  return future;
}

void
collection::get_changes(const get_changes_options& options, get_changes_handler&& handler) const
{
  return impl_->get_changes(options.build(), std::move(handler));
}

auto
collection::get_changes(const get_changes_options& options) const
  -> std::future<std::pair<error, std::vector<tao::json::value>>>
{
  auto barrier = std::make_shared<std::promise<std::pair<error, std::vector<tao::json::value>>>>();
  auto future = barrier->get_future();
  get_changes(options, [barrier](auto err, auto changes) {
    barrier->set_value({ std::move(err), std::move(changes) });
  });
  return future;
}

void
collection::cancel_get_changes() const
{
  return impl_->cancel_get_changes();
}

void
collection::read(collection_properties_handler&& handler) const
{
  return impl_->read(std::move(handler));
}

auto
collection::read() const -> std::future<std::pair<error, collection_properties>>
{
  auto barrier = std::make_shared<std::promise<std::pair<error, collection_properties>>>();
  auto future = barrier->get_future();
  read([barrier](auto err, auto properties) {
    barrier->set_value({ std::move(err), std::move(properties) });
  });
  return future;
}

void
collection::remove(status_handler&& handler) const
{
  return impl_->remove(std::move(handler));
}

auto
collection::remove() const -> std::future<error>
{
  auto barrier = std::make_shared<std::promise<error>>();
  auto future = barrier->get_future();
  remove([barrier](auto err) {
    barrier->set_value(std::move(err));
  });
  return future;
}

void
collection::clear(status_handler&& handler) const
{
  return impl_->clear(std::move(handler));
}

auto
collection::clear() const -> std::future<error>
{
  auto barrier = std::make_shared<std::promise<error>>();
  auto future = barrier->get_future();
  clear([barrier](auto err) {
    barrier->set_value(std::move(err));
  });
  return future;
}

auto
collection::with_fresh_checkpoints() const -> collection
{
  return collection{ std::make_shared<collection_impl>(
    impl_->database(), impl_->id(), std::make_shared<core::memory_checkpoint_store>()) };
}
} // namespace fluentdb
