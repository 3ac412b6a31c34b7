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

#include <fluentdb/codec/tao_json_serializer.hxx>
#include <fluentdb/collection.hxx>
#include <fluentdb/document_traits.hxx>
#include <fluentdb/error.hxx>
#include <fluentdb/error_codes.hxx>
#include <fluentdb/status_handler.hxx>

#include <tao/json/value.hpp>

#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <type_traits>
#include <utility>
#include <vector>

namespace fluentdb
{
#ifndef FLUENTDB_DOXYGEN
namespace detail
{
template<typename Document,
         typename Serializer = codec::tao_json_serializer,
         std::enable_if_t<codec::is_serializer_v<Serializer>, bool> = true>
auto
encode_document(const Document& document, tao::json::value& encoded) -> error
{
  try {
    encoded = Serializer::serialize(document);
  } catch (const std::system_error& e) {
    return { e.code(), e.what() };
  }
  return {};
}

template<typename Document,
         typename Serializer = codec::tao_json_serializer,
         std::enable_if_t<codec::is_serializer_v<Serializer>, bool> = true>
auto
decode_document(const tao::json::value& encoded, Document& document) -> error
{
  try {
    document = Serializer::template deserialize<Document>(encoded);
  } catch (const std::system_error& e) {
    return { e.code(), e.what() };
  }
  return {};
}

template<typename Document,
         typename Serializer = codec::tao_json_serializer,
         std::enable_if_t<codec::is_serializer_v<Serializer>, bool> = true>
auto
decode_documents(const std::vector<tao::json::value>& encoded, std::vector<Document>& documents) -> error
{
  documents.reserve(encoded.size());
  for (const auto& value : encoded) {
    Document document{};
    if (auto err = decode_document<Document, Serializer>(value, document); err) {
      return err;
    }
    documents.emplace_back(std::move(document));
  }
  return {};
}
} // namespace detail
#endif

/**
 * Handle to a single typed document of a collection.
 *
 * The handle may be created without identifier, in which case @ref create adopts the identifier
 * assigned by the store.
 */
template<typename Document>
class document
{
  static_assert(is_document_v<Document>,
                "document type must be default constructible and expose an identifier through "
                "fluentdb::document_traits");

public:
  using document_type = Document;
  using create_handler = std::function<void(error, document)>;
  using create_list_handler = std::function<void(error, std::vector<document>)>;
  using content_handler = std::function<void(error, Document)>;

  explicit document(fluentdb::collection collection, std::optional<std::string> id = {})
    : collection_{ std::move(collection) }
    , id_{ std::move(id) }
  {
  }

  [[nodiscard]] auto id() const -> const std::optional<std::string>&
  {
    return id_;
  }

  [[nodiscard]] auto collection() const -> const fluentdb::collection&
  {
    return collection_;
  }

  /**
   * Stores a new document and returns a handle bound to its identifier.
   */
  void create(const Document& content, create_handler&& handler) const
  {
    tao::json::value encoded;
    if (auto err = detail::encode_document(content, encoded); err) {
      return handler(std::move(err), *this);
    }
    collection_.add(std::move(encoded),
                    [target = collection_, handler = std::move(handler)](auto err, auto stored) {
                      if (err) {
                        return handler(std::move(err), document{ target });
                      }
                      handler({}, document{ target, document_traits<tao::json::value>::id(stored) });
                    });
  }

  [[nodiscard]] auto create(const Document& content) const -> std::future<std::pair<error, document>>
  {
    auto barrier = std::make_shared<std::promise<std::pair<error, document>>>();
    auto future = barrier->get_future();
    create(content, [barrier](auto err, auto doc) {
      barrier->set_value({ std::move(err), std::move(doc) });
    });
    return future;
  }

  /**
   * Stores several documents concurrently and returns one handle per stored document.
   */
  void create(const std::vector<Document>& contents, create_list_handler&& handler) const
  {
    std::vector<tao::json::value> encoded;
    encoded.reserve(contents.size());
    for (const auto& content : contents) {
      tao::json::value value;
      if (auto err = detail::encode_document(content, value); err) {
        return handler(std::move(err), {});
      }
      encoded.emplace_back(std::move(value));
    }
    collection_.add(std::move(encoded),
                    [target = collection_, handler = std::move(handler)](auto err, auto stored) {
                      if (err) {
                        return handler(std::move(err), {});
                      }
                      std::vector<document> documents;
                      documents.reserve(stored.size());
                      for (const auto& value : stored) {
                        documents.emplace_back(target, document_traits<tao::json::value>::id(value));
                      }
                      handler({}, std::move(documents));
                    });
  }

  [[nodiscard]] auto create(const std::vector<Document>& contents) const
    -> std::future<std::pair<error, std::vector<document>>>
  {
    auto barrier = std::make_shared<std::promise<std::pair<error, std::vector<document>>>>();
    auto future = barrier->get_future();
    create(contents, [barrier](auto err, auto docs) {
      barrier->set_value({ std::move(err), std::move(docs) });
    });
    return future;
  }

  void read(content_handler&& handler) const
  {
    if (!id_) {
      return handler(error{ errc::common::invalid_argument, "document handle has no identifier" }, {});
    }
    collection_.get(id_.value(), [handler = std::move(handler)](auto err, auto stored) {
      Document content{};
      if (!err) {
        err = detail::decode_document(stored, content);
      }
      handler(std::move(err), std::move(content));
    });
  }

  [[nodiscard]] auto read() const -> std::future<std::pair<error, Document>>
  {
    auto barrier = std::make_shared<std::promise<std::pair<error, Document>>>();
    auto future = barrier->get_future();
    read([barrier](auto err, auto content) {
      barrier->set_value({ std::move(err), std::move(content) });
    });
    return future;
  }

  /**
   * Replaces the document. The identifier of the handle overrides the one of the content.
   */
  void update(Document content, content_handler&& handler) const
  {
    if (!id_) {
      return handler(error{ errc::common::invalid_argument, "document handle has no identifier" }, {});
    }
    document_traits<Document>::set_id(content, id_.value());
    tao::json::value encoded;
    if (auto err = detail::encode_document(content, encoded); err) {
      return handler(std::move(err), {});
    }
    collection_.upsert(std::move(encoded), [handler = std::move(handler)](auto err, auto stored) {
      Document updated{};
      if (!err) {
        err = detail::decode_document(stored, updated);
      }
      handler(std::move(err), std::move(updated));
    });
  }

  [[nodiscard]] auto update(Document content) const -> std::future<std::pair<error, Document>>
  {
    auto barrier = std::make_shared<std::promise<std::pair<error, Document>>>();
    auto future = barrier->get_future();
    update(std::move(content), [barrier](auto err, auto updated) {
      barrier->set_value({ std::move(err), std::move(updated) });
    });
    return future;
  }

  /**
   * Reads the document, applies the mutation and stores the result.
   */
  void edit(std::function<void(Document&)> mutation, content_handler&& handler) const
  {
    read([self = *this, mutation = std::move(mutation), handler = std::move(handler)](auto err,
                                                                                        auto content) mutable {
      if (err) {
        return handler(std::move(err), {});
      }
      mutation(content);
      self.update(std::move(content), std::move(handler));
    });
  }

  [[nodiscard]] auto edit(std::function<void(Document&)> mutation) const
    -> std::future<std::pair<error, Document>>
  {
    auto barrier = std::make_shared<std::promise<std::pair<error, Document>>>();
    auto future = barrier->get_future();
    edit(std::move(mutation), [barrier](auto err, auto edited) {
      barrier->set_value({ std::move(err), std::move(edited) });
    });
    return future;
  }

  void remove(status_handler&& handler) const
  {
    if (!id_) {
      return handler(error{ errc::common::invalid_argument, "document handle has no identifier" });
    }
    collection_.remove(id_.value(), std::move(handler));
  }

  [[nodiscard]] auto remove() const -> std::future<error>
  {
    auto barrier = std::make_shared<std::promise<error>>();
    auto future = barrier->get_future();
    remove([barrier](auto err) {
      barrier->set_value(std::move(err));
    });
    return future;
  }

  /**
   * Handle to the same document viewed as another type.
   */
  template<typename Other>
  [[nodiscard]] auto cast() const -> document<Other>
  {
    return document<Other>{ collection_.with_fresh_checkpoints(), id_ };
  }

private:
  fluentdb::collection collection_;
  std::optional<std::string> id_;
};
} // namespace fluentdb
