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

#pragma once

#include <tao/json/value.hpp>

#include <string>
#include <type_traits>
#include <utility>

namespace fluentdb
{
#ifndef FLUENTDB_DOXYGEN
namespace detail
{
template<typename Document, typename = void>
struct has_id_member : std::false_type {
};

template<typename Document>
struct has_id_member<Document, std::void_t<decltype(std::declval<Document&>().id)>>
  : std::is_assignable<std::string&, decltype(std::declval<const Document&>().id)> {
};
} // namespace detail
#endif

/**
 * Describes how the library reads and assigns the identifier of a document type.
 *
 * Types with a public `id` member convertible to `std::string` work out of the box. Other types
 * specialize this template and provide `id()` and `set_id()`. A specialization may also provide
 * `collection_name()`, used when a collection is requested without an explicit name.
 */
template<typename Document, typename Enable = void>
struct document_traits {
};

template<typename Document>
struct document_traits<Document, std::enable_if_t<detail::has_id_member<Document>::value>> {
  static auto id(const Document& document) -> std::string
  {
    return document.id;
  }

  static void set_id(Document& document, std::string id)
  {
    document.id = std::move(id);
  }
};

template<>
struct document_traits<tao::json::value> {
  static auto id(const tao::json::value& document) -> std::string
  {
    if (!document.is_object()) {
      return {};
    }
    if (const auto* id = document.find("id"); id != nullptr && id->is_string()) {
      return id->get_string();
    }
    return {};
  }

  static void set_id(tao::json::value& document, std::string id)
  {
    if (!document.is_object()) {
      document = tao::json::empty_object;
    }
    document["id"] = std::move(id);
  }
};

#ifndef FLUENTDB_DOXYGEN
namespace detail
{
template<typename Document, typename = void>
struct has_document_traits : std::false_type {
};

template<typename Document>
struct has_document_traits<
  Document,
  std::void_t<decltype(document_traits<Document>::id(std::declval<const Document&>())),
              decltype(document_traits<Document>::set_id(std::declval<Document&>(), std::string{}))>>
  : std::true_type {
};

template<typename Document, typename = void>
struct has_traits_collection_name : std::false_type {
};

template<typename Document>
struct has_traits_collection_name<Document,
                                  std::void_t<decltype(document_traits<Document>::collection_name())>>
  : std::true_type {
};

template<typename Document, typename = void>
struct has_static_collection_name : std::false_type {
};

template<typename Document>
struct has_static_collection_name<Document, std::void_t<decltype(Document::collection_name)>>
  : std::true_type {
};
} // namespace detail
#endif

/**
 * A type can be stored in a typed collection view when it is default constructible and its
 * identifier is reachable through @ref document_traits.
 */
template<typename Document>
inline constexpr bool is_document_v =
  std::is_default_constructible_v<Document> && detail::has_document_traits<Document>::value;

template<typename Document>
auto
default_collection_name() -> std::string
{
  if constexpr (detail::has_traits_collection_name<Document>::value) {
    return std::string{ document_traits<Document>::collection_name() };
  } else {
    static_assert(detail::has_static_collection_name<Document>::value,
                  "the document type does not declare a collection name, pass it explicitly");
    return std::string{ Document::collection_name };
  }
}
} // namespace fluentdb
