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

#include "utils/io_thread.hxx"
#include "utils/store_shortcuts.hxx"

#include "core/memory_store.hxx"

#include <fluentdb/error_codes.hxx>

#include <set>

using test::utils::execute;

namespace
{
const fluentdb::core::collection_link link{ "app", "orders" };

auto
read_page(fluentdb::core::change_feed_cursor& cursor) -> std::tuple<std::error_code, fluentdb::core::change_feed_page>
{
  return execute<std::error_code, fluentdb::core::change_feed_page>([&cursor](auto&& handler) {
    cursor.next_page(std::move(handler));
  });
}
} // namespace

TEST_CASE("unit: memory store databases and collections", "[unit]")
{
  test::utils::init_logger();
  test::utils::io_thread io;
  auto store = std::make_shared<fluentdb::core::memory_store>(io.io());

  {
    auto [ec, properties] = execute<std::error_code, fluentdb::database_properties>([&](auto&& handler) {
      store->create_database("app", false, std::move(handler));
    });
    REQUIRE_SUCCESS(ec);
    REQUIRE(properties.id == "app");
    REQUIRE_FALSE(properties.resource_id.empty());
    REQUIRE_FALSE(properties.etag.empty());
  }

  SECTION("database already exists")
  {
    auto [ec, properties] = execute<std::error_code, fluentdb::database_properties>([&](auto&& handler) {
      store->create_database("app", false, std::move(handler));
    });
    REQUIRE(ec == fluentdb::errc::document_store::database_exists);

    auto [existing_ec, existing] = execute<std::error_code, fluentdb::database_properties>([&](auto&& handler) {
      store->create_database("app", true, std::move(handler));
    });
    REQUIRE_SUCCESS(existing_ec);
    REQUIRE(existing.id == "app");
  }

  SECTION("empty identifiers")
  {
    auto [db_ec, db] = execute<std::error_code, fluentdb::database_properties>([&](auto&& handler) {
      store->create_database("", true, std::move(handler));
    });
    REQUIRE(db_ec == fluentdb::errc::common::invalid_argument);

    auto [coll_ec, coll] = execute<std::error_code, fluentdb::collection_properties>([&](auto&& handler) {
      store->create_collection({ "app", "" }, true, std::move(handler));
    });
    REQUIRE(coll_ec == fluentdb::errc::common::invalid_argument);
  }

  SECTION("collection requires its database")
  {
    auto [ec, properties] = execute<std::error_code, fluentdb::collection_properties>([&](auto&& handler) {
      store->create_collection({ "missing", "orders" }, true, std::move(handler));
    });
    REQUIRE(ec == fluentdb::errc::document_store::database_not_found);
  }

  SECTION("collection lifecycle")
  {
    auto [ec, properties] = execute<std::error_code, fluentdb::collection_properties>([&](auto&& handler) {
      store->create_collection(link, false, std::move(handler));
    });
    REQUIRE_SUCCESS(ec);
    REQUIRE(properties.id == "orders");
    REQUIRE(properties.database_id == "app");
    REQUIRE(properties.partition_key_range_count == 1);

    auto [exists_ec, exists] = execute<std::error_code, fluentdb::collection_properties>([&](auto&& handler) {
      store->create_collection(link, false, std::move(handler));
    });
    REQUIRE(exists_ec == fluentdb::errc::document_store::collection_exists);

    auto [list_ec, collections] =
      execute<std::error_code, std::vector<fluentdb::collection_properties>>([&](auto&& handler) {
        store->list_collections("app", std::move(handler));
      });
    REQUIRE_SUCCESS(list_ec);
    REQUIRE(collections.size() == 1);

    auto [delete_ec] = execute<std::error_code>([&](auto&& handler) {
      store->delete_collection(link, std::move(handler));
    });
    REQUIRE_SUCCESS(delete_ec);

    auto [read_ec, read] = execute<std::error_code, fluentdb::collection_properties>([&](auto&& handler) {
      store->read_collection(link, std::move(handler));
    });
    REQUIRE(read_ec == fluentdb::errc::document_store::collection_not_found);
  }

  SECTION("deleting a database removes its collections")
  {
    REQUIRE_SUCCESS(test::utils::create_collection(*store, link));
    REQUIRE_SUCCESS(test::utils::insert_document(*store, link, test::utils::make_document("doc-1")));

    auto [delete_ec] = execute<std::error_code>([&](auto&& handler) {
      store->delete_database("app", std::move(handler));
    });
    REQUIRE_SUCCESS(delete_ec);

    auto [again_ec] = execute<std::error_code>([&](auto&& handler) {
      store->delete_database("app", std::move(handler));
    });
    REQUIRE(again_ec == fluentdb::errc::document_store::database_not_found);

    auto [list_ec, databases] =
      execute<std::error_code, std::vector<fluentdb::database_properties>>([&](auto&& handler) {
        store->list_databases(std::move(handler));
      });
    REQUIRE_SUCCESS(list_ec);
    REQUIRE(databases.empty());

    REQUIRE_SUCCESS(test::utils::create_collection(*store, link));
    auto [docs_ec, documents] = execute<std::error_code, std::vector<tao::json::value>>([&](auto&& handler) {
      store->list_documents(link, std::move(handler));
    });
    REQUIRE_SUCCESS(docs_ec);
    REQUIRE(documents.empty());
  }
}

TEST_CASE("unit: memory store documents", "[unit]")
{
  test::utils::init_logger();
  test::utils::io_thread io;
  auto store = std::make_shared<fluentdb::core::memory_store>(io.io());
  REQUIRE_SUCCESS(test::utils::create_collection(*store, link));

  auto create = [&store](tao::json::value document) {
    return execute<std::error_code, tao::json::value>([&store, &document](auto&& handler) {
      store->create_document(link, std::move(document), std::move(handler));
    });
  };

  SECTION("system properties are stamped")
  {
    auto [ec, stored] = create(test::utils::make_document("doc-1", 5));
    REQUIRE_SUCCESS(ec);
    REQUIRE(stored.at("id").get_string() == "doc-1");
    REQUIRE(stored.at("value").get_signed() == 5);
    REQUIRE(stored.find("_rid") != nullptr);
    REQUIRE(stored.find("_etag") != nullptr);
    REQUIRE(stored.find("_ts") != nullptr);
    REQUIRE(stored.find("_lsn") != nullptr);

    auto [read_ec, read] = execute<std::error_code, tao::json::value>([&](auto&& handler) {
      store->read_document(link, "doc-1", std::move(handler));
    });
    REQUIRE_SUCCESS(read_ec);
    REQUIRE(read == stored);
  }

  SECTION("identifier is generated when missing")
  {
    tao::json::value anonymous = tao::json::empty_object;
    anonymous["value"] = 1;
    auto [ec, stored] = create(anonymous);
    REQUIRE_SUCCESS(ec);
    REQUIRE(stored.at("id").get_string().size() == 36);

    anonymous["id"] = "";
    auto [empty_ec, empty] = create(anonymous);
    REQUIRE_SUCCESS(empty_ec);
    REQUIRE_FALSE(empty.at("id").get_string().empty());
  }

  SECTION("invalid documents")
  {
    auto [array_ec, array] = create(tao::json::value::array({ 1, 2 }));
    REQUIRE(array_ec == fluentdb::errc::common::invalid_argument);

    tao::json::value numeric_id = tao::json::empty_object;
    numeric_id["id"] = 42;
    auto [id_ec, id] = create(numeric_id);
    REQUIRE(id_ec == fluentdb::errc::common::invalid_argument);
  }

  SECTION("duplicate identifier")
  {
    REQUIRE_SUCCESS(std::get<0>(create(test::utils::make_document("doc-1"))));
    auto [ec, stored] = create(test::utils::make_document("doc-1"));
    REQUIRE(ec == fluentdb::errc::document_store::document_exists);
  }

  SECTION("upsert replaces the document and changes its etag")
  {
    auto [ec, first] = create(test::utils::make_document("doc-1", 1));
    REQUIRE_SUCCESS(ec);
    auto [upsert_ec, second] = execute<std::error_code, tao::json::value>([&](auto&& handler) {
      store->upsert_document(link, test::utils::make_document("doc-1", 2), std::move(handler));
    });
    REQUIRE_SUCCESS(upsert_ec);
    REQUIRE(second.at("value").get_signed() == 2);
    REQUIRE(second.at("_etag") != first.at("_etag"));

    auto [list_ec, documents] = execute<std::error_code, std::vector<tao::json::value>>([&](auto&& handler) {
      store->list_documents(link, std::move(handler));
    });
    REQUIRE_SUCCESS(list_ec);
    REQUIRE(documents.size() == 1);
  }

  SECTION("missing documents")
  {
    auto [read_ec, read] = execute<std::error_code, tao::json::value>([&](auto&& handler) {
      store->read_document(link, "missing", std::move(handler));
    });
    REQUIRE(read_ec == fluentdb::errc::document_store::document_not_found);

    REQUIRE(test::utils::delete_document(*store, link, "missing") ==
            fluentdb::errc::document_store::document_not_found);
  }

  SECTION("missing collection")
  {
    REQUIRE(test::utils::insert_document(*store, { "app", "missing" }, test::utils::make_document("doc-1")) ==
            fluentdb::errc::document_store::collection_not_found);
  }
}

TEST_CASE("unit: memory store partition key ranges", "[unit]")
{
  test::utils::init_logger();
  test::utils::io_thread io;
  fluentdb::core::memory_store_options options{};
  options.partition_count = 5;
  options.range_page_size = 2;
  auto store = std::make_shared<fluentdb::core::memory_store>(io.io(), options);
  REQUIRE_SUCCESS(test::utils::create_collection(*store, link));

  SECTION("listing is paginated and covers the whole key space")
  {
    auto [ec, page] = execute<std::error_code, fluentdb::core::partition_range_page>([&](auto&& handler) {
      store->list_partition_ranges(link, {}, std::move(handler));
    });
    REQUIRE_SUCCESS(ec);
    REQUIRE(page.ranges.size() == 2);
    REQUIRE(page.continuation_token.has_value());

    auto ranges = test::utils::list_ranges(*store, link);
    REQUIRE(ranges.size() == 5);
    REQUIRE(ranges.front().min_inclusive == "00000000");
    REQUIRE(ranges.back().max_exclusive == "100000000");
    std::set<std::string> ids;
    for (std::size_t i = 0; i < ranges.size(); ++i) {
      ids.insert(ranges[i].id);
      if (i > 0) {
        REQUIRE(ranges[i - 1].max_exclusive == ranges[i].min_inclusive);
      }
    }
    REQUIRE(ids.size() == 5);
  }

  SECTION("malformed continuation token")
  {
    auto [ec, page] = execute<std::error_code, fluentdb::core::partition_range_page>([&](auto&& handler) {
      store->list_partition_ranges(link, "not-a-number", std::move(handler));
    });
    REQUIRE(ec == fluentdb::errc::common::invalid_argument);
  }

  SECTION("split")
  {
    auto before = test::utils::list_ranges(*store, link);
    REQUIRE_SUCCESS(test::utils::split_range(*store, link, before[1].id));

    auto after = test::utils::list_ranges(*store, link);
    REQUIRE(after.size() == 6);
    REQUIRE(after[1].min_inclusive == before[1].min_inclusive);
    REQUIRE(after[2].max_exclusive == before[1].max_exclusive);
    REQUIRE(after[1].max_exclusive == after[2].min_inclusive);
    REQUIRE(after[1].id != before[1].id);
    REQUIRE(after[2].id != before[1].id);

    REQUIRE(test::utils::split_range(*store, link, before[1].id) ==
            fluentdb::errc::document_store::partition_range_gone);

    auto [ec, properties] = execute<std::error_code, fluentdb::collection_properties>([&](auto&& handler) {
      store->read_collection(link, std::move(handler));
    });
    REQUIRE_SUCCESS(ec);
    REQUIRE(properties.partition_key_range_count == 6);
  }
}

TEST_CASE("unit: memory store change feed", "[unit]")
{
  test::utils::init_logger();
  test::utils::io_thread io;
  auto store = std::make_shared<fluentdb::core::memory_store>(io.io());
  REQUIRE_SUCCESS(test::utils::create_collection(*store, link));
  for (const auto* id : { "doc-1", "doc-2", "doc-3" }) {
    REQUIRE_SUCCESS(test::utils::insert_document(*store, link, test::utils::make_document(id)));
  }

  SECTION("from the beginning")
  {
    auto cursor = store->open_change_feed({ link, "0", {}, true, 2 });
    REQUIRE(cursor->has_more());

    auto [ec, page] = read_page(*cursor);
    REQUIRE_SUCCESS(ec);
    REQUIRE(test::utils::ids_of(page.documents) == std::vector<std::string>{ "doc-1", "doc-2" });
    REQUIRE(cursor->has_more());

    auto [next_ec, next] = read_page(*cursor);
    REQUIRE_SUCCESS(next_ec);
    REQUIRE(test::utils::ids_of(next.documents) == std::vector<std::string>{ "doc-3" });
    REQUIRE_FALSE(cursor->has_more());

    // resuming from the last token yields only later changes
    REQUIRE_SUCCESS(test::utils::insert_document(*store, link, test::utils::make_document("doc-4")));
    auto resumed = store->open_change_feed({ link, "0", next.continuation_token, false, 10 });
    auto [resumed_ec, changes] = read_page(*resumed);
    REQUIRE_SUCCESS(resumed_ec);
    REQUIRE(test::utils::ids_of(changes.documents) == std::vector<std::string>{ "doc-4" });
  }

  SECTION("from now")
  {
    auto cursor = store->open_change_feed({ link, "0", {}, false, 10 });
    auto [ec, page] = read_page(*cursor);
    REQUIRE_SUCCESS(ec);
    REQUIRE(page.documents.empty());
    REQUIRE_FALSE(cursor->has_more());
  }

  SECTION("unknown range")
  {
    auto cursor = store->open_change_feed({ link, "42", {}, true, 10 });
    auto [ec, page] = read_page(*cursor);
    REQUIRE(ec == fluentdb::errc::document_store::partition_range_gone);
  }
}
