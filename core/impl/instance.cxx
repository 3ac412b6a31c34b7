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

#include "instance_impl.hxx"

#include "core/impl/database_impl.hxx"
#include "core/impl/error.hxx"
#include "core/logger/logger.hxx"
#include "core/memory_store.hxx"
#include "core/utils/connection_string.hxx"

#include <fluentdb/error_codes.hxx>
#include <fluentdb/instance.hxx>

#include <fmt/core.h>

#include <future>
#include <mutex>
#include <utility>

namespace fluentdb
{
instance_impl::instance_impl(instance_options::built options)
  : options_{ std::move(options) }
  , work_{ asio::make_work_guard(*io_) }
  , io_thread_{ [io = io_] {
    io->run();
  } }
{
}

instance_impl::~instance_impl()
{
  stop();
}

void
instance_impl::stop()
{
  work_.reset();
  io_->stop();
  if (!io_thread_.joinable()) {
    return;
  }
  if (io_thread_.get_id() == std::this_thread::get_id()) {
    // released from one of its own handlers, the thread keeps io_ alive until run() returns
    io_thread_.detach();
  } else {
    io_thread_.join();
  }
}

auto
instance_impl::open(const document_store_factory& factory) -> std::error_code
{
  if (!factory) {
    return errc::common::invalid_argument;
  }
  store_ = factory(*io_);
  if (!store_) {
    return errc::common::invalid_argument;
  }
  return {};
}

void
instance_impl::close(std::function<void()>&& handler)
{
  // the io thread cannot join itself
  std::thread([self = shared_from_this(), handler = std::move(handler)]() mutable {
    self->stop();
    handler();
  }).detach();
}

auto
instance_impl::io() -> asio::io_context&
{
  return *io_;
}

auto
instance_impl::store() const -> const std::shared_ptr<core::document_store>&
{
  return store_;
}

auto
instance_impl::options() const -> const instance_options::built&
{
  return options_;
}

auto
instance_impl::epoch() const -> std::uint64_t
{
  return epoch_.load();
}

void
instance_impl::advance_epoch()
{
  ++epoch_;
}

void
instance_impl::add_database(std::string database_id, database_properties_handler&& handler)
{
  store_->create_database(
    database_id,
    false,
    [database_id, handler = std::move(handler)](std::error_code ec, database_properties properties) {
      handler(core::impl::make_error({ ec, "add_database", database_id }), std::move(properties));
    });
}

void
instance_impl::databases(database_properties_list_handler&& handler)
{
  store_->list_databases(
    [handler = std::move(handler)](std::error_code ec, std::vector<database_properties> result) {
      handler(core::impl::make_error({ ec, "databases" }), std::move(result));
    });
}

void
instance_impl::clear(status_handler&& handler)
{
  store_->list_databases([self = shared_from_this(), handler = std::move(handler)](
                           std::error_code ec, std::vector<database_properties> existing) mutable {
    if (ec) {
      return handler(core::impl::make_error({ ec, "clear" }));
    }
    if (existing.empty()) {
      return handler({});
    }
    struct clear_state {
      std::mutex mutex{};
      std::size_t remaining;
      error first_error{};
      std::shared_ptr<instance_impl> instance;
      status_handler handler;
    };
    auto state = std::make_shared<clear_state>();
    state->remaining = existing.size();
    state->instance = self;
    state->handler = std::move(handler);
    FLUENTDB_LOG_DEBUG("deleting {} database(s)", existing.size());
    for (const auto& properties : existing) {
      self->store_->delete_database(properties.id, [state, database_id = properties.id](std::error_code ec) {
        std::unique_lock lock(state->mutex);
        if (ec && ec != errc::document_store::database_not_found && !state->first_error) {
          state->first_error = core::impl::make_error({ ec, "clear", database_id });
        }
        if (--state->remaining > 0) {
          return;
        }
        lock.unlock();
        state->instance->advance_epoch();
        state->handler(std::move(state->first_error));
      });
    }
  });
}

instance::instance(std::shared_ptr<instance_impl> impl)
  : impl_{ std::move(impl) }
{
}

void
instance::connect(document_store_factory factory,
                  const instance_options& options,
                  instance_connect_handler&& handler)
{
  auto impl = std::make_shared<instance_impl>(options.build());
  if (auto ec = impl->open(factory); ec) {
    FLUENTDB_LOG_ERROR("unable to create document store: {}", ec.message());
    return handler(core::impl::make_error({ ec, "connect" }), {});
  }
  FLUENTDB_LOG_DEBUG("connected, change_feed_page_size={}, max_partition_range_pages={}, checkpoint_directory=\"{}\"",
                     impl->options().change_feed_page_size,
                     impl->options().max_partition_range_pages,
                     impl->options().checkpoint_directory);
  handler({}, instance{ std::move(impl) });
}

auto
instance::connect(document_store_factory factory, const instance_options& options)
  -> std::future<std::pair<error, instance>>
{
  auto barrier = std::make_shared<std::promise<std::pair<error, instance>>>();
  auto future = barrier->get_future();
  connect(std::move(factory), options, [barrier](auto err, auto i) {
    barrier->set_value({ std::move(err), std::move(i) });
  });
  return future;
}

void
instance::connect(const std::string& connection_string,
                  const std::string& /* account_key */,
                  const instance_options& options,
                  instance_connect_handler&& handler)
{
  auto connstr = core::utils::parse_connection_string(connection_string, options);
  if (connstr.error) {
    FLUENTDB_LOG_ERROR("{}", connstr.error.value());
    return handler(error{ errc::common::parsing_failure, connstr.error.value() }, {});
  }
  for (const auto& warning : connstr.warnings) {
    FLUENTDB_LOG_WARNING("{}", warning);
  }
  if (connstr.scheme != core::utils::connection_string::memory_scheme) {
    FLUENTDB_LOG_ERROR(R"(scheme "{}" is not supported, only "{}" is available)",
                       connstr.scheme,
                       core::utils::connection_string::memory_scheme);
    return handler(error{ errc::common::feature_not_available,
                          fmt::format(R"(scheme "{}" is not supported)", connstr.scheme) },
                   {});
  }

  auto built = connstr.options.build();
  core::memory_store_options store_options{ built.partition_count, built.range_page_size };
  connect(
    [store_options](asio::io_context& io) -> std::shared_ptr<core::document_store> {
      return std::make_shared<core::memory_store>(io, store_options);
    },
    connstr.options,
    std::move(handler));
}

auto
instance::connect(const std::string& connection_string,
                  const std::string& account_key,
                  const instance_options& options) -> std::future<std::pair<error, instance>>
{
  auto barrier = std::make_shared<std::promise<std::pair<error, instance>>>();
  auto future = barrier->get_future();
  connect(connection_string, account_key, options, [barrier](auto err, auto i) {
    barrier->set_value({ std::move(err), std::move(i) });
  });
  return future;
}

void
instance::close(std::function<void()>&& handler) const
{
  if (!impl_) {
    return handler();
  }
  impl_->close(std::move(handler));
}

auto
instance::close() const -> std::future<void>
{
  auto barrier = std::make_shared<std::promise<void>>();
  auto future = barrier->get_future();
  close([barrier] {
    barrier->set_value();
  });
  return future;
}

auto
instance::database(std::string database_id) const -> fluentdb::database
{
  return fluentdb::database{ std::make_shared<database_impl>(impl_, std::move(database_id)) };
}

void
instance::add_database(std::string database_id, database_properties_handler&& handler) const
{
  return impl_->add_database(std::move(database_id), std::move(handler));
}

auto
instance::add_database(std::string database_id) const
  -> std::future<std::pair<error, database_properties>>
{
  auto barrier = std::make_shared<std::promise<std::pair<error, database_properties>>>();
  auto future = barrier->get_future();
  add_database(std::move(database_id), [barrier](auto err, auto properties) {
    barrier->set_value({ std::move(err), std::move(properties) });
  });
  return future;
}

void
instance::add_databases(std::vector<std::string> database_ids,
                        database_properties_list_handler&& handler) const
{
  if (database_ids.empty()) {
    return handler({}, {});
  }

  struct add_state {
    std::mutex mutex{};
    std::size_t remaining;
    error first_error{};
    std::vector<database_properties> results;
    database_properties_list_handler handler;
  };
  auto state = std::make_shared<add_state>();
  state->remaining = database_ids.size();
  state->results.resize(database_ids.size());
  state->handler = std::move(handler);
  for (std::size_t i = 0; i < database_ids.size(); ++i) {
    impl_->add_database(std::move(database_ids[i]), [state, i](auto err, auto properties) {
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
instance::add_databases(std::vector<std::string> database_ids) const
  -> std::future<std::pair<error, std::vector<database_properties>>>
{
  auto barrier =
    std::make_shared<std::promise<std::pair<error, std::vector<database_properties>>>>();
  auto future = barrier->get_future();
  add_databases(std::move(database_ids), [barrier](auto err, auto result) {
    barrier->set_value({ std::move(err), std::move(result) });
  });
  return future;
}

void
instance::databases(database_properties_list_handler&& handler) const
{
  return impl_->databases(std::move(handler));
}

auto
instance::databases() const -> std::future<std::pair<error, std::vector<database_properties>>>
{
  auto barrier =
    std::make_shared<std::promise<std::pair<error, std::vector<database_properties>>>>();
  auto future = barrier->get_future();
  databases([barrier](auto err, auto result) {
    barrier->set_value({ std::move(err), std::move(result) });
  });
  return future;
}

void
instance::clear(status_handler&& handler) const
{
  return impl_->clear(std::move(handler));
}

auto
instance::clear() const -> std::future<error>
{
  auto barrier = std::make_shared<std::promise<error>>();
  auto future = barrier->get_future();
  clear([barrier](auto err) {
    barrier->set_value(std::move(err));
  });
  return future;
}
} // namespace fluentdb
