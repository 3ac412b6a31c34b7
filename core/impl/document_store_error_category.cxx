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

#include <fluentdb/error_codes.hxx>

#include <string>

namespace fluentdb::core::impl
{
struct document_store_error_category : std::error_category {
  [[nodiscard]] const char* name() const noexcept override
  {
    return "fluentdb.document_store";
  }

  [[nodiscard]] std::string message(int ev) const noexcept override
  {
    switch (static_cast<errc::document_store>(ev)) {
      case errc::document_store::database_not_found:
        return "database_not_found (101)";
      case errc::document_store::database_exists:
        return "database_exists (102)";
      case errc::document_store::collection_not_found:
        return "collection_not_found (103)";
      case errc::document_store::collection_exists:
        return "collection_exists (104)";
      case errc::document_store::document_not_found:
        return "document_not_found (105)";
      case errc::document_store::document_exists:
        return "document_exists (106)";
      case errc::document_store::partition_range_gone:
        return "partition_range_gone (107)";
    }
    return "FIXME: unknown error code (recompile with newer library): fluentdb.document_store." +
           std::to_string(ev);
  }
};

const inline static document_store_error_category category_instance;

const std::error_category&
document_store_category() noexcept
{
  return category_instance;
}
} // namespace fluentdb::core::impl
