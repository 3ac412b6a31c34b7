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

#include <fluentdb/codec/serializer_traits.hxx>
#include <fluentdb/error_codes.hxx>

#include <tao/json/value.hpp>

#include <stdexcept>
#include <string>
#include <system_error>
#include <type_traits>

namespace fluentdb::codec
{
/**
 * Converts documents using `tao::json::traits<Document>`.
 */
class tao_json_serializer
{
public:
  using document_type = tao::json::value;

  template<typename Document>
  static auto serialize(const Document& document) -> tao::json::value
  {
    try {
      if constexpr (std::is_same_v<Document, tao::json::value>) {
        return document;
      } else {
        return tao::json::value(document);
      }
    } catch (const std::logic_error& e) {
      throw std::system_error(errc::common::encoding_failure,
                              std::string("tao_json_serializer cannot encode document: ").append(e.what()));
    }
  }

  template<typename Document>
  static auto deserialize(const tao::json::value& data) -> Document
  {
    try {
      if constexpr (std::is_same_v<Document, tao::json::value>) {
        return data;
      } else {
        return data.as<Document>();
      }
    } catch (const std::out_of_range& e) {
      throw std::system_error(errc::common::decoding_failure,
                              std::string("tao_json_serializer cannot decode document: ").append(e.what()));
    } catch (const std::logic_error& e) {
      throw std::system_error(errc::common::decoding_failure,
                              std::string("tao_json_serializer cannot decode document: ").append(e.what()));
    }
  }
};

#ifndef FLUENTDB_DOXYGEN
template<>
struct is_serializer<tao_json_serializer> : public std::true_type {
};
#endif
} // namespace fluentdb::codec
