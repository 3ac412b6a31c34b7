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

#include <fluentdb/collection.hxx>
#include <fluentdb/document.hxx>
#include <fluentdb/document_traits.hxx>
#include <fluentdb/error.hxx>
#include <fluentdb/get_changes_options.hxx>
#include <fluentdb/properties.hxx>
#include <fluentdb/status_handler.hxx>

#include <tao/json/value.hpp>

#include <algorithm>
#include <functional>
#include <future>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace fluentdb
{
/**
 * Typed view of a collection. Documents are converted with `tao::json::traits<Document>`.
 *
 * A view owns its change feed checkpoints: @ref get_changes returns the documents changed since
 * the previous call on this view (or its copies).
 */
template<typename Document>
class document_collection
{
  static_assert(is_document_v<Document>,
                "document type must be default constructible and expose an identifier through "
                "fluentdb::document_traits");

public:
  using document_type = Document;
  using content_handler = std::function<void(error, Document)>;
  using content_list_handler = std::function<void(error, std::vector<Document>)>;

  explicit document_collection(fluentdb::collection collection)
    : collection_{ std::move(collection) }
  {
  }

  [[nodiscard]] auto id() const -> const std::string&
  {
    return collection_.id();
  }

  [[nodiscard]] auto underlying() const -> const collection&
  {
    return collection_;
  }

  /**
   * Handle to a document of this collection. Without identifier, the handle is meant for
   * document::create.
   */
  [[nodiscard]] auto document(std::optional<std::string> document_id = {}) const
    -> fluentdb::document<Document>
  {
    return fluentdb::document<Document>{ collection_, std::move(document_id) };
  }

  /**
   * Stores a new document.
   *
   * @return the stored document, with the identifier assigned by the store when it had none
   */
  void add(const Document& content, content_handler&& handler) const
  {
    tao::json::value encoded;
    if (auto err = detail::encode_document(content, encoded); err) {
      return handler(std::move(err), {});
    }
    collection_.add(std::move(encoded), [handler = std::move(handler)](auto err, auto stored) {
      Document added{};
      if (!err) {
        err = detail::decode_document(stored, added);
      }
      handler(std::move(err), std::move(added));
    });
  }

  [[nodiscard]] auto add(const Document& content) const -> std::future<std::pair<error, Document>>
  {
    auto barrier = std::make_shared<std::promise<std::pair<error, Document>>>();
    auto future = barrier->get_future();
    add(content, [barrier](auto err, auto added) {
      barrier->set_value({ std::move(err), std::move(added) });
    });
    return future;
  }

  void add(const std::vector<Document>& contents, content_list_handler&& handler) const
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
    collection_.add(std::move(encoded), [handler = std::move(handler)](auto err, auto stored) {
      std::vector<Document> added;
      if (!err) {
        err = detail::decode_documents(stored, added);
      }
      handler(std::move(err), std::move(added));
    });
  }

  [[nodiscard]] auto add(const std::vector<Document>& contents) const
    -> std::future<std::pair<error, std::vector<Document>>>
  {
    auto barrier = std::make_shared<std::promise<std::pair<error, std::vector<Document>>>>();
    auto future = barrier->get_future();
    add(contents, [barrier](auto err, auto added) {
      barrier->set_value({ std::move(err), std::move(added) });
    });
    return future;
  }

  void query(content_list_handler&& handler) const
  {
    query(std::function<bool(const Document&)>{}, std::move(handler));
  }

  [[nodiscard]] auto query() const -> std::future<std::pair<error, std::vector<Document>>>
  {
    return query(std::function<bool(const Document&)>{});
  }

  /**
   * Returns the documents for which the predicate holds. The predicate is evaluated by the
   * client on every document of the collection.
   */
  void query(std::function<bool(const Document&)> predicate, content_list_handler&& handler) const
  {
    collection_.query(
      [predicate = std::move(predicate), handler = std::move(handler)](auto err, auto stored) {
        std::vector<Document> documents;
        if (!err) {
          err = detail::decode_documents(stored, documents);
        }
        if (!err && predicate) {
          documents.erase(std::remove_if(documents.begin(),
                                         documents.end(),
                                         [&predicate](const Document& doc) {
                                           return !predicate(doc);
                                         }),
                          documents.end());
        }
        handler(std::move(err), std::move(documents));
      });
  }

  [[nodiscard]] auto query(std::function<bool(const Document&)> predicate) const
    -> std::future<std::pair<error, std::vector<Document>>>
  {
    auto barrier = std::make_shared<std::promise<std::pair<error, std::vector<Document>>>>();
    auto future = barrier->get_future();
    query(std::move(predicate), [barrier](auto err, auto documents) {
      barrier->set_value({ std::move(err), std::move(documents) });
    });
    return future;
  }

  /**
   * Returns the documents changed since the previous call on this view.
   *
   * Every page is decoded before its checkpoint is stored. A document that cannot be decoded
   * fails the call, and the next call starts again from the page that contains it.
   */
  void get_changes(const get_changes_options& options, content_list_handler&& handler) const
  {
    auto decoded = std::make_shared<std::vector<Document>>();
    auto decoding_options = options;
    decoding_options.on_page(
      [decoded, on_page = options.build().on_page](const std::vector<tao::json::value>& page) {
        if (on_page) {
          if (auto err = on_page(page); err) {
            return err;
          }
        }
        std::vector<Document> documents;
        if (auto err = detail::decode_documents(page, documents); err) {
          return err;
        }
        std::move(documents.begin(), documents.end(), std::back_inserter(*decoded));
        return error{};
      });
    collection_.get_changes(decoding_options, [decoded, handler = std::move(handler)](auto err, auto /* changes */) {
      if (err) {
        return handler(std::move(err), {});
      }
      handler({}, std::move(*decoded));
    });
  }

  [[nodiscard]] auto get_changes(const get_changes_options& options = {}) const
    -> std::future<std::pair<error, std::vector<Document>>>
  {
    auto barrier = std::make_shared<std::promise<std::pair<error, std::vector<Document>>>>();
    auto future = barrier->get_future();
    get_changes(options, [barrier](auto err, auto documents) {
      barrier->set_value({ std::move(err), std::move(documents) });
    });
    return future;
  }

  void cancel_get_changes() const
  {
    collection_.cancel_get_changes();
  }

  void read(collection_properties_handler&& handler) const
  {
    collection_.read(std::move(handler));
  }

  [[nodiscard]] auto read() const -> std::future<std::pair<error, collection_properties>>
  {
    return collection_.read();
  }

  void remove(status_handler&& handler) const
  {
    collection_.remove(std::move(handler));
  }

  [[nodiscard]] auto remove() const -> std::future<error>
  {
    return collection_.remove();
  }

  void clear(status_handler&& handler) const
  {
    collection_.clear(std::move(handler));
  }

  [[nodiscard]] auto clear() const -> std::future<error>
  {
    return collection_.clear();
  }

  /**
   * View of the same collection as another document type. The new view starts with empty
   * change feed checkpoints.
   */
  template<typename Other>
  [[nodiscard]] auto cast() const -> document_collection<Other>
  {
    return document_collection<Other>{ collection_.with_fresh_checkpoints() };
  }

private:
  fluentdb::collection collection_;
};
} // namespace fluentdb
