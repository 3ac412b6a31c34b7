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

#include "database_impl.hxx"

#include "core/checkpoint_store.hxx"
#include "core/impl/collection_impl.hxx"
#include "core/impl/error.hxx"
#include "core/impl/instance_impl.hxx"
#include "core/logger/logger.hxx"
#include "core/utils/url_codec.hxx"

#include <fluentdb/database.hxx>
#include <fluentdb/error_codes.hxx>

#include <fmt/core.h>

#include <filesystem>
#include <future>
#include <mutex>
#include <utility>

namespace fluentdb
{
database_impl::database_impl(std::shared_ptr<instance_impl> instance, std::string id)
  : instance_{ std::move(instance) }
  , id_{ std::move(id) }
{
}

auto
database_impl::id() const -> const std::string&
{
  return id_;
}

auto
database_impl::instance() const -> const std::shared_ptr<instance_impl>&
{
  return instance_;
}

void
database_impl::ensure(core::utils::movable_function<void(std::error_code)>&& handler)
{
  const auto epoch = static_cast<std::int64_t>(instance_->epoch());
  if (ensured_epoch_ == epoch) {
    return handler({});
  }
  instance_->store()->create_database(
    id_,
    true,
    [self = shared_from_this(), epoch, handler = std::move(handler)](std::error_code ec,
                                                                     database_properties /* properties */) mutable {
      if (!ec) {
        self->ensured_epoch_ = epoch;
      }
      handler(ec);
    });
}

auto
database_impl::make_collection(std::string collection_id) -> fluentdb::collection
{
  std::shared_ptr<core::checkpoint_store> checkpoints;
  if (const auto& directory = instance_->options().checkpoint_directory; !directory.empty()) {
    auto path = std::filesystem::path{ directory } /
                fmt::format("{}.{}.json",
                            core::utils::string_codec::path_escape(id_),
                            core::utils::string_codec::path_escape(collection_id));
    checkpoints = std::make_shared<core::file_checkpoint_store>(path.string());
  } else {
    checkpoints = std::make_shared<core::memory_checkpoint_store>();
  }
  return fluentdb::collection{
    std::make_shared<collection_impl>(shared_from_this(), std::move(collection_id), std::move(checkpoints))
  };
}

void
database_impl::add_collection(std::string collection_id, collection_properties_handler&& handler)
{
  ensure([self = shared_from_this(), collection_id, handler = std::move(handler)](std::error_code ec) mutable {
    if (ec) {
      return handler(core::impl::make_error({ ec, "add_collection", self->id_, collection_id }), {});
    }
    self->instance_->store()->create_collection(
      { self->id_, collection_id },
      false,
      [self, collection_id, handler = std::move(handler)](std::error_code ec, collection_properties properties) {
        handler(core::impl::make_error({ ec, "add_collection", self->id_, collection_id }), std::move(properties));
      });
  });
}

void
database_impl::collections(collection_properties_list_handler&& handler)
{
  ensure([self = shared_from_this(), handler = std::move(handler)](std::error_code ec) mutable {
    if (ec) {
      return handler(core::impl::make_error({ ec, "collections", self->id_ }), {});
    }
    self->instance_->store()->list_collections(
      self->id_,
      [self, handler = std::move(handler)](std::error_code ec, std::vector<collection_properties> result) {
        handler(core::impl::make_error({ ec, "collections", self->id_ }), std::move(result));
      });
  });
}

void
database_impl::read(database_properties_handler&& handler)
{
  ensure([self = shared_from_this(), handler = std::move(handler)](std::error_code ec) mutable {
    if (ec) {
      return handler(core::impl::make_error({ ec, "read_database", self->id_ }), {});
    }
    self->instance_->store()->read_database(
      self->id_, [self, handler = std::move(handler)](std::error_code ec, database_properties properties) {
        handler(core::impl::make_error({ ec, "read_database", self->id_ }), std::move(properties));
      });
  });
}

void
database_impl::remove(status_handler&& handler)
{
  instance_->store()->delete_database(
    id_, [self = shared_from_this(), handler = std::move(handler)](std::error_code ec) {
      self->instance_->advance_epoch();
      handler(core::impl::make_error({ ec, "remove_database", self->id_ }));
    });
}

void
database_impl::clear(status_handler&& handler)
{
  instance_->store()->delete_database(
    id_, [self = shared_from_this(), handler = std::move(handler)](std::error_code ec) mutable {
      if (ec && ec != errc::document_store::database_not_found) {
        return handler(core::impl::make_error({ ec, "clear_database", self->id_ }));
      }
      self->instance_->advance_epoch();
      FLUENTDB_LOG_DEBUG("database \"{}\" deleted, creating it again", self->id_);
      self->ensure([self, handler = std::move(handler)](std::error_code ec) {
        handler(core::impl::make_error({ ec, "clear_database", self->id_ }));
      });
    });
}

database::database(std::shared_ptr<database_impl> impl)
  : impl_{ std::move(impl) }
{
}

auto
database::id() const -> const std::string&
{
  return impl_->id();
}

auto
database::collection(std::string collection_id) const -> fluentdb::collection
{
  return impl_->make_collection(std::move(collection_id));
}

void
database::add_collection(std::string collection_id, collection_properties_handler&& handler) const
{
  return impl_->add_collection(std::move(collection_id), std::move(handler));
}

auto
database::add_collection(std::string collection_id) const
  -> std::future<std::pair<error, collection_properties>>
{
  auto barrier = std::make_shared<std::promise<std::pair<error, collection_properties>>>();
  auto future = barrier->get_future();
  add_collection(std::move(collection_id), [barrier](auto err, auto properties) {
    barrier->set_value({ std::move(err), std::move(properties) });
  });
  return future;
}

void
database::add_collections(std::vector<std::string> collection_ids,
                          collection_properties_list_handler&& handler) const
{
  if (collection_ids.empty()) {
    return handler({}, {});
  }

  struct add_state {
    std::mutex mutex{};
    std::size_t remaining;
    error first_error{};
    std::vector<collection_properties> results;
    collection_properties_list_handler handler;
  };
  auto state = std::make_shared<add_state>();
  state->remaining = collection_ids.size();
  state->results.resize(collection_ids.size());
  state->handler = std::move(handler);
  for (std::size_t i = 0; i < collection_ids.size(); ++i) {
    impl_->add_collection(std::move(collection_ids[i]), [state, i](auto err, auto properties) {
      std::unique_lock lock(state->mutex);
      if (err && !state->first_error) {
        state->first_error = std::move(err);
      }
      state->results[i] = std::move(properties);
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

auto
database::add_collections(std::vector<std::string> collection_ids) const
  -> std::future<std::pair<error, std::vector<collection_properties>>>
{
  auto barrier =
    std::make_shared<std::promise<std::pair<error, std::vector<collection_properties>>>>();
  auto future = barrier->get_future();
  add_collections(std::move(collection_ids), [barrier](auto err, auto result) {
    barrier->set_value({ std::move(err), std::move(result) });
  });
  return future;
}

void
database::collections(collection_properties_list_handler&& handler) const
{
  return impl_->collections(std::move(handler));
}

auto
database::collections() const -> std::future<std::pair<error, std::vector<collection_properties>>>
{
  auto barrier =
    std::make_shared<std::promise<std::pair<error, std::vector<collection_properties>>>>();
  auto future = barrier->get_future();
  collections([barrier](auto err, auto result) {
    barrier->set_value({ std::move(err), std::move(result) });
  });
  return future;
}

void
database::read(database_properties_handler&& handler) const
{
  return impl_->read(std::move(handler));
}

auto
database::read() const -> std::future<std::pair<error, database_properties>>
{
  auto barrier = std::make_shared<std::promise<std::pair<error, database_properties>>>();
  auto future = barrier->get_future();
  read([barrier](auto err, auto properties) {
    barrier->set_value({ std::move(err), std::move(properties) });
  });
  return future;
}

void
database::remove(status_handler&& handler) const
{
  return impl_->remove(std::move(handler));
}

auto
database::remove() const -> std::future<error>
{
  auto barrier = std::make_shared<std::promise<error>>();
  auto future = barrier->get_future();
  remove([barrier](auto err) {
    barrier->set_value(std::move(err));
  });
  return future;
}

void
database::clear(status_handler&& handler) const
{
  return impl_->clear(std::move(handler));
}

auto
database::clear() const -> std::future<error>
{
  auto barrier = std::make_shared<std::promise<error>>();
  auto future = barrier->get_future();
  clear([barrier](auto err) {
    barrier->set_value(std::move(err));
  });
  return future;
}
} // namespace fluentdb
