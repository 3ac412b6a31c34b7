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
struct common_error_category : std::error_category {
  [[nodiscard]] const char* name() const noexcept override
  {
    return "fluentdb.common";
  }

  [[nodiscard]] std::string message(int ev) const noexcept override
  {
    switch (static_cast<errc::common>(ev)) {
      case errc::common::request_canceled:
        return "request_canceled (2)";
      case errc::common::invalid_argument:
        return "invalid_argument (3)";
      case errc::common::service_not_available:
        return "service_not_available (4)";
      case errc::common::internal_server_failure:
        return "internal_server_failure (5)";
      case errc::common::temporary_failure:
        return "temporary_failure (7)";
      case errc::common::parsing_failure:
        return "parsing_failure (8)";
      case errc::common::ambiguous_timeout:
        return "ambiguous_timeout (13)";
      case errc::common::feature_not_available:
        return "feature_not_available (15)";
      case errc::common::encoding_failure:
        return "encoding_failure (19)";
      case errc::common::decoding_failure:
        return "decoding_failure (20)";
    }
    return "FIXME: unknown error code (recompile with newer library): fluentdb.common." +
           std::to_string(ev);
  }
};

const inline static common_error_category category_instance;

const std::error_category&
common_category() noexcept
{
  return category_instance;
}
} // namespace fluentdb::core::impl
