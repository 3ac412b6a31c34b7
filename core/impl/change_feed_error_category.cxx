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
struct change_feed_error_category : std::error_category {
  [[nodiscard]] const char* name() const noexcept override
  {
    return "fluentdb.change_feed";
  }

  [[nodiscard]] std::string message(int ev) const noexcept override
  {
    switch (static_cast<errc::change_feed>(ev)) {
      case errc::change_feed::partition_range_listing_not_terminated:
        return "partition_range_listing_not_terminated (201)";
      case errc::change_feed::checkpoint_read_failure:
        return "checkpoint_read_failure (202)";
      case errc::change_feed::checkpoint_write_failure:
        return "checkpoint_write_failure (203)";
      case errc::change_feed::invalid_page_size:
        return "invalid_page_size (204)";
    }
    return "FIXME: unknown error code (recompile with newer library): fluentdb.change_feed." +
           std::to_string(ev);
  }
};

const inline static change_feed_error_category category_instance;

const std::error_category&
change_feed_category() noexcept
{
  return category_instance;
}
} // namespace fluentdb::core::impl
