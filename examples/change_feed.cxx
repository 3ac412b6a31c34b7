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

#include <fluentdb/codec/tao_json_serializer.hxx>
#include <fluentdb/database.hxx>
#include <fluentdb/document_collection.hxx>
#include <fluentdb/instance.hxx>
#include <fluentdb/logger.hxx>

#include <fluentdb/fmt/error.hxx>

#include <fmt/core.h>

#include <cstdint>
#include <iostream>
#include <string>

struct order {
  static constexpr auto collection_name{ "orders" };

  std::string id{};
  std::string customer{};
  std::uint64_t quantity{};
};

template<>
struct tao::json::traits<order> {
  template<template<typename...> class Traits>
  static void assign(tao::json::basic_value<Traits>& v, const order& o)
  {
    v = {
      { "id", o.id },
      { "customer", o.customer },
      { "quantity", o.quantity },
    };
  }

  template<template<typename...> class Traits>
  static auto as(const tao::json::basic_value<Traits>& v) -> order
  {
    order o;
    const auto& object = v.get_object();
    o.id = object.at("id").template as<std::string>();
    o.customer = object.at("customer").template as<std::string>();
    o.quantity = object.at("quantity").template as<std::uint64_t>();
    return o;
  }
};

static constexpr auto connection_string{ "memory://local?partition_count=4&change_feed_page_size=10" };

int
main()
{
  fluentdb::logger::initialize_console_logger();
  fluentdb::logger::set_level(fluentdb::logger::log_level::info);

  auto [connect_err, instance] = fluentdb::instance::connect(connection_string, "").get();
  if (connect_err) {
    std::cout << "Unable to connect. " << fmt::format("{}", connect_err) << "\n";
    return 1;
  }

  auto orders = instance.database("shop").collection<order>();

  for (std::uint64_t i = 0; i < 3; ++i) {
    auto [err, added] = orders.add(order{ "", fmt::format("customer-{}", i), i + 1 }).get();
    if (err) {
      std::cout << "add: " << fmt::format("{}", err) << "\n";
    }
  }

  for (int round = 0; round < 2; ++round) {
    auto [err, changes] = orders.get_changes().get();
    if (err) {
      std::cout << "get_changes: " << fmt::format("{}", err) << "\n";
      break;
    }
    std::cout << "round " << round << ": " << changes.size() << " change(s)\n";
    for (const auto& o : changes) {
      std::cout << "  id: " << o.id << ", customer: " << o.customer << ", quantity: " << o.quantity << "\n";
    }
  }

  instance.close().get();
  return 0;
}
