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

#include <system_error>

namespace fluentdb
{
#ifndef FLUENTDB_DOXYGEN
namespace core::impl
{
const std::error_category&
common_category() noexcept;

const std::error_category&
document_store_category() noexcept;

const std::error_category&
change_feed_category() noexcept;
} // namespace core::impl
#endif

namespace errc
{
enum class common {
  /// The operation was cancelled by the caller before it could complete.
  request_canceled = 2,

  /// An argument passed to the operation is not valid (empty identifier, zero page size, etc.).
  invalid_argument = 3,

  /// The document store could not be reached, or it reported that it is unavailable.
  service_not_available = 4,

  /// The document store failed to process the request.
  internal_server_failure = 5,

  /// The document store is overloaded; the request may be retried later by the caller.
  temporary_failure = 7,

  /// The input (for example a connection string) could not be parsed.
  parsing_failure = 8,

  /// The operation did not complete in the allotted time, but may have had side effects (for
  /// example, checkpoints of the pages read before the deadline were stored).
  ambiguous_timeout = 13,

  /// The endpoint or feature requested is not available in this build.
  feature_not_available = 15,

  /// The document could not be encoded to JSON.
  encoding_failure = 19,

  /// The document could not be decoded from JSON into the requested type.
  decoding_failure = 20,
};

enum class document_store {
  database_not_found = 101,

  database_exists = 102,

  collection_not_found = 103,

  collection_exists = 104,

  document_not_found = 105,

  document_exists = 106,

  /// The partition key range does not exist anymore (it was split or merged by the store).
  partition_range_gone = 107,
};

enum class change_feed {
  /// The store kept returning continuation tokens while listing partition key ranges.
  partition_range_listing_not_terminated = 201,

  /// The checkpoint store could not provide the resumption token for a partition key range.
  checkpoint_read_failure = 202,

  /// The checkpoint store could not persist the resumption token for a partition key range.
  checkpoint_write_failure = 203,

  /// The change feed page size must be greater than zero.
  invalid_page_size = 204,
};

#ifndef FLUENTDB_DOXYGEN
inline std::error_code
make_error_code(common e) noexcept
{
  return { static_cast<int>(e), core::impl::common_category() };
}

inline std::error_code
make_error_code(document_store e) noexcept
{
  return { static_cast<int>(e), core::impl::document_store_category() };
}

inline std::error_code
make_error_code(change_feed e) noexcept
{
  return { static_cast<int>(e), core::impl::change_feed_category() };
}
#endif
} // namespace errc
} // namespace fluentdb

#ifndef FLUENTDB_DOXYGEN
template<>
struct std::is_error_code_enum<fluentdb::errc::common> : std::true_type {
};

template<>
struct std::is_error_code_enum<fluentdb::errc::document_store> : std::true_type {
};

template<>
struct std::is_error_code_enum<fluentdb::errc::change_feed> : std::true_type {
};
#endif
