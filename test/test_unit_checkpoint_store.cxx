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

#include "core/change_feed_reader.hxx"
#include "core/checkpoint_store.hxx"
#include "core/memory_store.hxx"
#include "core/uuid.hxx"

#include <fluentdb/error_codes.hxx>

#include <filesystem>
#include <fstream>

namespace
{
class temporary_directory
{
public:
  temporary_directory()
    : path_{ std::filesystem::temp_directory_path() /
             ("fluentdb-test-" + fluentdb::core::uuid::to_string(fluentdb::core::uuid::random())) }
  {
  }

  temporary_directory(const temporary_directory&) = delete;
  auto operator=(const temporary_directory&) -> temporary_directory& = delete;

  ~temporary_directory()
  {
    std::error_code ignored;
    std::filesystem::remove_all(path_, ignored);
  }

  [[nodiscard]] auto file(const std::string& name) const -> std::string
  {
    return (path_ / name).string();
  }

private:
  std::filesystem::path path_;
};

void
write_file(const std::string& path, const std::string& content)
{
  std::filesystem::create_directories(std::filesystem::path(path).parent_path());
  std::ofstream output(path, std::ios::binary | std::ios::trunc);
  output << content;
}
} // namespace

TEST_CASE("unit: memory checkpoint store", "[unit]")
{
  fluentdb::core::memory_checkpoint_store checkpoints;

  auto token = checkpoints.load("0");
  EXPECT_SUCCESS(token);
  REQUIRE_FALSE(token->has_value());

  REQUIRE_SUCCESS(checkpoints.save("0", "10"));
  REQUIRE_SUCCESS(checkpoints.save("1", "4"));
  REQUIRE_SUCCESS(checkpoints.save("0", "12"));
  REQUIRE(checkpoints.load("0").value() == "12");
  REQUIRE(checkpoints.range_ids().value() == std::vector<std::string>{ "0", "1" });

  REQUIRE_SUCCESS(checkpoints.erase("0"));
  REQUIRE_FALSE(checkpoints.load("0")->has_value());
  REQUIRE(checkpoints.range_ids().value() == std::vector<std::string>{ "1" });

  SECTION("erasing an unknown range is not an error")
  {
    REQUIRE_SUCCESS(checkpoints.erase("42"));
  }
}

TEST_CASE("unit: file checkpoint store persists tokens", "[unit]")
{
  test::utils::init_logger();
  temporary_directory directory;
  const auto path = directory.file("nested/app.orders.json");

  {
    fluentdb::core::file_checkpoint_store checkpoints{ path };
    REQUIRE(checkpoints.path() == path);

    auto ids = checkpoints.range_ids();
    EXPECT_SUCCESS(ids);
    REQUIRE(ids->empty());

    REQUIRE_SUCCESS(checkpoints.save("0", "7"));
    REQUIRE_SUCCESS(checkpoints.save("1", "3"));
    REQUIRE_SUCCESS(checkpoints.erase("1"));
  }
  REQUIRE(std::filesystem::exists(path));
  REQUIRE_FALSE(std::filesystem::exists(path + ".tmp"));

  fluentdb::core::file_checkpoint_store reopened{ path };
  auto token = reopened.load("0");
  EXPECT_SUCCESS(token);
  REQUIRE(token->value_or("") == "7");
  REQUIRE_FALSE(reopened.load("1")->has_value());
  REQUIRE(reopened.range_ids().value() == std::vector<std::string>{ "0" });
}

TEST_CASE("unit: file checkpoint store rejects unreadable files", "[unit]")
{
  test::utils::init_logger();
  temporary_directory directory;
  const auto path = directory.file("checkpoints.json");

  SECTION("not JSON")
  {
    write_file(path, "{ not json");
  }

  SECTION("not an object")
  {
    write_file(path, R"(["0", "1"])");
  }

  SECTION("token is not a string")
  {
    write_file(path, R"({"0": 42})");
  }

  fluentdb::core::file_checkpoint_store checkpoints{ path };
  auto token = checkpoints.load("0");
  REQUIRE_FALSE(token.has_value());
  REQUIRE(token.error() == fluentdb::errc::change_feed::checkpoint_read_failure);
  REQUIRE(checkpoints.save("0", "1") == fluentdb::errc::change_feed::checkpoint_read_failure);
}

TEST_CASE("unit: file checkpoint store reports write failures", "[unit]")
{
  test::utils::init_logger();
  temporary_directory directory;
  const auto blocker = directory.file("blocker");
  write_file(blocker, "regular file");

  // the parent of the checkpoint file is a regular file
  fluentdb::core::file_checkpoint_store checkpoints{ blocker + "/checkpoints.json" };
  REQUIRE(checkpoints.save("0", "1") == fluentdb::errc::change_feed::checkpoint_write_failure);

  auto token = checkpoints.load("0");
  EXPECT_SUCCESS(token);
  REQUIRE_FALSE(token->has_value());
}

TEST_CASE("unit: change feed reader resumes from checkpoints stored in a file", "[unit]")
{
  test::utils::init_logger();
  temporary_directory directory;
  const auto path = directory.file("app.orders.json");

  test::utils::io_thread io;
  auto store = std::make_shared<fluentdb::core::memory_store>(io.io());
  const fluentdb::core::collection_link link{ "app", "orders" };
  REQUIRE_SUCCESS(test::utils::create_collection(*store, link));
  REQUIRE_SUCCESS(test::utils::insert_document(*store, link, test::utils::make_document("doc-1")));

  {
    fluentdb::core::change_feed_reader reader{
      io.io(), store, link, std::make_shared<fluentdb::core::file_checkpoint_store>(path)
    };
    auto changes = reader.read();
    EXPECT_SUCCESS(changes);
    REQUIRE(changes->size() == 1);
  }

  REQUIRE_SUCCESS(test::utils::insert_document(*store, link, test::utils::make_document("doc-2")));

  fluentdb::core::change_feed_reader restarted{
    io.io(), store, link, std::make_shared<fluentdb::core::file_checkpoint_store>(path)
  };
  auto changes = restarted.read();
  EXPECT_SUCCESS(changes);
  REQUIRE(test::utils::ids_of(changes.value()) == std::vector<std::string>{ "doc-2" });
}
