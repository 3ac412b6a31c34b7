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

#include "test_helper.hxx"

#include "another_simple_object.hxx"
#include "simple_object.hxx"
#include "utils/fault_injecting_store.hxx"
#include "utils/wait_until.hxx"

#include "core/memory_store.hxx"
#include "core/uuid.hxx"

#include <fluentdb/database.hxx>
#include <fluentdb/document.hxx>
#include <fluentdb/document_collection.hxx>
#include <fluentdb/error_codes.hxx>
#include <fluentdb/instance.hxx>

#include <asio/io_context.hpp>

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <future>
#include <memory>

namespace
{
auto
connect(const std::string& connection_string = "memory://local") -> fluentdb::instance
{
  auto [err, instance] = fluentdb::instance::connect(connection_string, "").get();
  REQUIRE_NO_ERROR(err);
  return instance;
}

auto
names_of(const std::vector<SimpleObject>& objects) -> std::vector<std::string>
{
  std::vector<std::string> names;
  names.reserve(objects.size());
  for (const auto& object : objects) {
    names.emplace_back(object.name);
  }
  std::sort(names.begin(), names.end());
  return names;
}
} // namespace

TEST_CASE("unit: get changes returns new documents only", "[unit]")
{
  test::utils::init_logger();
  auto instance = connect();
  auto objects = instance.database("test").collection<SimpleObject>();
  REQUIRE(objects.id() == "simple_objects");

  {
    auto [err, added] = objects.add(SimpleObject{ "", "first", 1 }).get();
    REQUIRE_NO_ERROR(err);
    REQUIRE_FALSE(added.id.empty());

    auto [changes_err, changes] = objects.get_changes().get();
    REQUIRE_NO_ERROR(changes_err);
    REQUIRE(changes.size() == 1);
    REQUIRE(changes[0] == added);
  }

  {
    auto [err, added] = objects.add({ SimpleObject{ "", "second", 2 }, SimpleObject{ "", "third", 3 } }).get();
    REQUIRE_NO_ERROR(err);
    REQUIRE(added.size() == 2);

    auto [changes_err, changes] = objects.get_changes().get();
    REQUIRE_NO_ERROR(changes_err);
    REQUIRE(names_of(changes) == std::vector<std::string>{ "second", "third" });
  }

  {
    auto [changes_err, changes] = objects.get_changes().get();
    REQUIRE_NO_ERROR(changes_err);
    REQUIRE(changes.empty());
  }

  instance.close().get();
}

TEST_CASE("unit: typed documents", "[unit]")
{
  test::utils::init_logger();
  auto instance = connect();
  auto objects = instance.database("test").collection<SimpleObject>("crud");

  auto [create_err, handle] = objects.document().create(SimpleObject{ "apple", "Apple", 10 }).get();
  REQUIRE_NO_ERROR(create_err);
  REQUIRE(handle.id() == "apple");

  SECTION("read")
  {
    auto [err, content] = objects.document("apple").read().get();
    REQUIRE_NO_ERROR(err);
    REQUIRE(content == SimpleObject{ "apple", "Apple", 10 });
  }

  SECTION("update keeps the identifier of the handle")
  {
    auto [err, content] = handle.update(SimpleObject{ "other", "Green apple", 11 }).get();
    REQUIRE_NO_ERROR(err);
    REQUIRE(content == SimpleObject{ "apple", "Green apple", 11 });

    auto [query_err, all] = objects.query().get();
    REQUIRE_NO_ERROR(query_err);
    REQUIRE(all.size() == 1);
  }

  SECTION("edit")
  {
    auto [err, content] = handle
                            .edit([](SimpleObject& object) {
                              object.number += 5;
                            })
                            .get();
    REQUIRE_NO_ERROR(err);
    REQUIRE(content.number == 15);

    auto [read_err, stored] = handle.read().get();
    REQUIRE_NO_ERROR(read_err);
    REQUIRE(stored.number == 15);
  }

  SECTION("remove")
  {
    REQUIRE_NO_ERROR(handle.remove().get());

    auto [err, content] = handle.read().get();
    REQUIRE(err.ec() == fluentdb::errc::document_store::document_not_found);
    auto ctx = err.ctx().as<tao::json::value>();
    REQUIRE(ctx.at("operation").get_string() == "get");
    REQUIRE(ctx.at("database").get_string() == "test");
    REQUIRE(ctx.at("collection").get_string() == "crud");
    REQUIRE(ctx.at("document_id").get_string() == "apple");

    REQUIRE(handle.remove().get().ec() == fluentdb::errc::document_store::document_not_found);
  }

  SECTION("duplicate identifier")
  {
    auto [err, duplicate] = objects.document().create(SimpleObject{ "apple", "Apple", 12 }).get();
    REQUIRE(err.ec() == fluentdb::errc::document_store::document_exists);
  }

  SECTION("handle without identifier")
  {
    auto [err, content] = objects.document().read().get();
    REQUIRE(err.ec() == fluentdb::errc::common::invalid_argument);
  }

  SECTION("cast")
  {
    auto [err, narrow] = handle.cast<AnotherSimpleObject>().read().get();
    REQUIRE_NO_ERROR(err);
    REQUIRE(narrow == AnotherSimpleObject{ "apple", 10 });
  }

  instance.close().get();
}

TEST_CASE("unit: typed collections", "[unit]")
{
  test::utils::init_logger();
  auto instance = connect();
  auto objects = instance.database("test").collection<SimpleObject>();

  auto [add_err, added] = objects
                            .add({
                              SimpleObject{ "a", "alpha", 1 },
                              SimpleObject{ "b", "beta", 2 },
                              SimpleObject{ "c", "gamma", 3 },
                            })
                            .get();
  REQUIRE_NO_ERROR(add_err);

  SECTION("query with predicate")
  {
    auto [err, odd] = objects
                        .query([](const SimpleObject& object) {
                          return object.number % 2 == 1;
                        })
                        .get();
    REQUIRE_NO_ERROR(err);
    REQUIRE(names_of(odd) == std::vector<std::string>{ "alpha", "gamma" });
  }

  SECTION("cast starts with fresh checkpoints")
  {
    auto [err, changes] = objects.get_changes().get();
    REQUIRE_NO_ERROR(err);
    REQUIRE(changes.size() == 3);

    auto narrow = objects.cast<AnotherSimpleObject>();
    auto [narrow_err, narrow_changes] = narrow.get_changes().get();
    REQUIRE_NO_ERROR(narrow_err);
    REQUIRE(narrow_changes.size() == 3);

    auto [again_err, again] = objects.get_changes().get();
    REQUIRE_NO_ERROR(again_err);
    REQUIRE(again.empty());
  }

  SECTION("undecodable documents")
  {
    tao::json::value foreign{
      { "id", "d" },
      { "colour", "blue" },
    };
    auto [raw_err, raw] = objects.underlying().add(foreign).get();
    REQUIRE_NO_ERROR(raw_err);

    auto [err, all] = objects.query().get();
    REQUIRE(err.ec() == fluentdb::errc::common::decoding_failure);

    auto [changes_err, changes] = objects.get_changes().get();
    REQUIRE(changes_err.ec() == fluentdb::errc::common::decoding_failure);
    REQUIRE_FALSE(changes_err.message().empty());
    REQUIRE(changes.empty());
    auto ctx = changes_err.ctx().as<tao::json::value>();
    REQUIRE(ctx.at("operation").get_string() == "get_changes");
    REQUIRE(ctx.at("partition_key_range_id").get_string() == "0");

    // the page holding the foreign document was not checkpointed
    auto [retry_err, retried] = objects.get_changes().get();
    REQUIRE(retry_err.ec() == fluentdb::errc::common::decoding_failure);

    tao::json::value fixed{
      { "id", "d" },
      { "name", "delta" },
      { "number", std::uint64_t{ 4 } },
    };
    auto [fix_err, stored] = objects.underlying().upsert(fixed).get();
    REQUIRE_NO_ERROR(fix_err);

    auto [fixed_err, fixed_changes] = objects.get_changes().get();
    REQUIRE_NO_ERROR(fixed_err);
    REQUIRE(fixed_changes == std::vector<SimpleObject>{ SimpleObject{ "d", "delta", 4 } });
  }

  SECTION("clear")
  {
    auto [changes_err, changes] = objects.get_changes().get();
    REQUIRE_NO_ERROR(changes_err);
    REQUIRE(changes.size() == 3);

    REQUIRE_NO_ERROR(objects.clear().get());

    auto [err, all] = objects.query().get();
    REQUIRE_NO_ERROR(err);
    REQUIRE(all.empty());

    auto [readd_err, readded] = objects.add(SimpleObject{ "a", "alpha", 1 }).get();
    REQUIRE_NO_ERROR(readd_err);

    auto [after_err, after] = objects.get_changes().get();
    REQUIRE_NO_ERROR(after_err);
    REQUIRE(names_of(after) == std::vector<std::string>{ "alpha" });
  }

  SECTION("remove and lazy recreation")
  {
    REQUIRE_NO_ERROR(objects.remove().get());

    auto [err, all] = objects.query().get();
    REQUIRE_NO_ERROR(err);
    REQUIRE(all.empty());

    auto [props_err, properties] = objects.read().get();
    REQUIRE_NO_ERROR(props_err);
    REQUIRE(properties.id == "simple_objects");
    REQUIRE(properties.database_id == "test");
  }

  SECTION("page size and timeout options")
  {
    fluentdb::get_changes_options options{};
    options.page_size(2).timeout(std::chrono::seconds(10));
    auto [err, changes] = objects.get_changes(options).get();
    REQUIRE_NO_ERROR(err);
    REQUIRE(changes.size() == 3);

    auto [zero_err, none] = objects.get_changes(fluentdb::get_changes_options{}.page_size(0)).get();
    REQUIRE(zero_err.ec() == fluentdb::errc::change_feed::invalid_page_size);
    REQUIRE(zero_err.ctx().as<tao::json::value>().at("operation").get_string() == "get_changes");
  }

  instance.close().get();
}

TEST_CASE("unit: databases and collections", "[unit]")
{
  test::utils::init_logger();
  auto instance = connect();

  {
    auto [err, properties] = instance.add_database("first").get();
    REQUIRE_NO_ERROR(err);
    REQUIRE(properties.id == "first");

    auto [again_err, again] = instance.add_database("first").get();
    REQUIRE(again_err.ec() == fluentdb::errc::document_store::database_exists);
  }

  {
    auto [err, databases] = instance.add_databases({ "second", "third" }).get();
    REQUIRE_NO_ERROR(err);
    REQUIRE(databases.size() == 2);
    REQUIRE(databases[0].id == "second");
    REQUIRE(databases[1].id == "third");
  }

  auto database = instance.database("first");
  {
    auto [err, collections] = database.add_collections({ "orders", "customers" }).get();
    REQUIRE_NO_ERROR(err);
    REQUIRE(collections.size() == 2);

    auto [list_err, listed] = database.collections().get();
    REQUIRE_NO_ERROR(list_err);
    REQUIRE(listed.size() == 2);

    auto [exists_err, exists] = database.add_collection("orders").get();
    REQUIRE(exists_err.ec() == fluentdb::errc::document_store::collection_exists);
  }

  SECTION("database clear keeps the database")
  {
    REQUIRE_NO_ERROR(database.clear().get());

    auto [err, listed] = database.collections().get();
    REQUIRE_NO_ERROR(err);
    REQUIRE(listed.empty());

    auto [read_err, properties] = database.read().get();
    REQUIRE_NO_ERROR(read_err);
    REQUIRE(properties.id == "first");
  }

  SECTION("handles recreate removed databases")
  {
    auto orders = database.collection("orders");
    auto [add_err, added] = orders.add(tao::json::value{ { "id", "order-1" } }).get();
    REQUIRE_NO_ERROR(add_err);

    REQUIRE_NO_ERROR(database.remove().get());

    auto [err, documents] = orders.query().get();
    REQUIRE_NO_ERROR(err);
    REQUIRE(documents.empty());
  }

  SECTION("instance clear removes every database")
  {
    REQUIRE_NO_ERROR(instance.clear().get());

    auto [err, databases] = instance.databases().get();
    REQUIRE_NO_ERROR(err);
    REQUIRE(databases.empty());
  }

  instance.close().get();
}

TEST_CASE("unit: connect", "[unit]")
{
  test::utils::init_logger();

  SECTION("options from the connection string")
  {
    auto instance = connect("memory://local?partition_count=3&change_feed_page_size=2");
    auto collection = instance.database("test").collection("orders");
    auto [err, properties] = collection.read().get();
    REQUIRE_NO_ERROR(err);
    REQUIRE(properties.partition_key_range_count == 3);
    instance.close().get();
  }

  SECTION("remote accounts are not available")
  {
    auto [err, instance] =
      fluentdb::instance::connect("https://account.documents.azure.com:443/", "secret").get();
    REQUIRE(err.ec() == fluentdb::errc::common::feature_not_available);
  }

  SECTION("malformed connection string")
  {
    auto [err, instance] = fluentdb::instance::connect("memory://local?partition_count", "").get();
    REQUIRE(err.ec() == fluentdb::errc::common::parsing_failure);
  }

  SECTION("store factory")
  {
    std::shared_ptr<test::utils::fault_injecting_store> store{};
    auto [err, instance] = fluentdb::instance::connect([&store](asio::io_context& io) {
                             store = std::make_shared<test::utils::fault_injecting_store>(
                               std::make_shared<fluentdb::core::memory_store>(io));
                             return store;
                           }).get();
    REQUIRE_NO_ERROR(err);
    REQUIRE(store != nullptr);

    auto collection = instance.database("test").collection("orders");
    auto [add_err, added] = collection.add(tao::json::value{ { "id", "order-1" } }).get();
    REQUIRE_NO_ERROR(add_err);

    store->fail_range_listing(fluentdb::errc::common::service_not_available);
    auto [changes_err, changes] = collection.get_changes().get();
    REQUIRE(changes_err.ec() == fluentdb::errc::common::service_not_available);
    auto listing_ctx = changes_err.ctx().as<tao::json::value>();
    REQUIRE(listing_ctx.at("collection").get_string() == "orders");
    REQUIRE(listing_ctx.find("partition_key_range_id") == nullptr);

    store->heal();
    store->fail_change_feed_pages(fluentdb::errc::common::temporary_failure);
    auto [page_err, page_changes] = collection.get_changes().get();
    REQUIRE(page_err.ec() == fluentdb::errc::common::temporary_failure);
    REQUIRE(page_changes.empty());
    REQUIRE(page_err.ctx().as<tao::json::value>().at("partition_key_range_id").get_string() == "0");

    store->heal();
    auto [retry_err, retried] = collection.get_changes().get();
    REQUIRE_NO_ERROR(retry_err);
    REQUIRE(retried.size() == 1);
    instance.close().get();
  }

  SECTION("factory without store")
  {
    auto [err, instance] = fluentdb::instance::connect([](asio::io_context& /* io */) {
                             return std::shared_ptr<fluentdb::core::document_store>{};
                           }).get();
    REQUIRE(err.ec() == fluentdb::errc::common::invalid_argument);
  }
}

TEST_CASE("unit: checkpoints stored in a directory survive the instance", "[unit]")
{
  test::utils::init_logger();
  const auto directory =
    std::filesystem::temp_directory_path() /
    ("fluentdb-test-" + fluentdb::core::uuid::to_string(fluentdb::core::uuid::random()));

  auto [err, instance] =
    fluentdb::instance::connect("memory://local", "", fluentdb::instance_options{}.checkpoint_directory(directory.string()))
      .get();
  REQUIRE_NO_ERROR(err);

  {
    auto objects = instance.database("test").collection<SimpleObject>();
    auto [add_err, added] = objects.add(SimpleObject{ "a", "alpha", 1 }).get();
    REQUIRE_NO_ERROR(add_err);
    auto [changes_err, changes] = objects.get_changes().get();
    REQUIRE_NO_ERROR(changes_err);
    REQUIRE(changes.size() == 1);
  }

  // a new handle of the same collection resumes from the stored checkpoints
  auto objects = instance.database("test").collection<SimpleObject>();
  auto [add_err, added] = objects.add(SimpleObject{ "b", "beta", 2 }).get();
  REQUIRE_NO_ERROR(add_err);
  auto [changes_err, changes] = objects.get_changes().get();
  REQUIRE_NO_ERROR(changes_err);
  REQUIRE(names_of(changes) == std::vector<std::string>{ "beta" });

  REQUIRE(std::filesystem::exists(directory / "test.simple_objects.json"));

  instance.close().get();
  std::error_code ignored;
  std::filesystem::remove_all(directory, ignored);
}

TEST_CASE("unit: instance released from its own completion handler", "[unit]")
{
  test::utils::init_logger();
  std::weak_ptr<fluentdb::core::document_store> weak_store{};
  auto [err, instance] =
    fluentdb::instance::connect([&weak_store](asio::io_context& io) -> std::shared_ptr<fluentdb::core::document_store> {
      auto store = std::make_shared<fluentdb::core::memory_store>(io);
      weak_store = store;
      return store;
    }).get();
  REQUIRE_NO_ERROR(err);

  auto added = std::make_shared<std::promise<fluentdb::error>>();
  auto released = std::make_shared<std::promise<void>>();
  {
    auto collection = instance.database("test").collection("orders");
    // the handler owns the last handles, they go away on the io thread once it returns
    collection.add(tao::json::value{ { "id", "order-1" } },
                   [instance = std::move(instance), collection, added, released](fluentdb::error add_err,
                                                                                 tao::json::value /* document */) {
                     added->set_value(std::move(add_err));
                     released->get_future().wait();
                   });
  }

  REQUIRE_NO_ERROR(added->get_future().get());
  released->set_value();

  REQUIRE(test::utils::wait_until([&weak_store]() {
    return weak_store.expired();
  }));
}
