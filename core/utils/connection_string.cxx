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

#include "connection_string.hxx"

#include "url_codec.hxx"

#include <fmt/core.h>
#include <tao/pegtl.hpp>
#include <tao/pegtl/contrib/uri.hpp>

#include <stdexcept>

namespace fluentdb::core::utils
{
namespace priv
{
using namespace tao::pegtl;

using param_key = star<sor<abnf::ALPHA, abnf::DIGIT, one<'_'>>>;
using param_value = star<sor<minus<uri::pchar, one<'=', '&', '?'>>, one<'/'>>>;
struct param : seq<param_key, one<'='>, param_value> {
};

struct reg_name : star<sor<uri::unreserved, uri::pct_encoded, uri::sub_delims>> {
};
struct host : sor<uri::IP_literal, uri::IPv4address, reg_name> {
};
using authority = seq<host, opt<uri::colon, uri::port>>;

using opt_path = opt<one<'/'>>;
using opt_params = opt_must<one<'?'>, list_must<param, one<'&'>>>;

struct scheme : seq<uri::scheme, one<':'>, uri::dslash> {
};
using opt_scheme = opt<scheme>;

using grammar = must<seq<opt_scheme, authority, opt_path, opt_params, tao::pegtl::eof>>;

template<typename Rule>
struct action {
};

template<>
struct action<scheme> {
  template<typename ActionInput>
  static void apply(const ActionInput& in, connection_string& cs)
  {
    cs.scheme = in.string().substr(0, in.string().rfind(':'));
  }
};

template<>
struct action<param> {
  template<typename ActionInput>
  static void apply(const ActionInput& in, connection_string& cs)
  {
    const auto& pair = in.string();
    auto eq = pair.find('=');
    std::string key = pair.substr(0, eq);
    cs.params[key] = (eq == std::string::npos) ? "" : pair.substr(eq + 1);
  }
};

template<>
struct action<reg_name> {
  template<typename ActionInput>
  static void apply(const ActionInput& in, connection_string& cs)
  {
    cs.host = string_codec::url_decode(in.string());
  }
};

template<>
struct action<uri::IPv4address> {
  template<typename ActionInput>
  static void apply(const ActionInput& in, connection_string& cs)
  {
    cs.host = in.string();
  }
};

template<>
struct action<uri::IPv6address> {
  template<typename ActionInput>
  static void apply(const ActionInput& in, connection_string& cs)
  {
    cs.host = in.string();
  }
};

template<>
struct action<uri::port> {
  template<typename ActionInput>
  static void apply(const ActionInput& in, connection_string& cs)
  {
    if (in.empty()) {
      return;
    }
    auto port = std::stoul(in.string());
    if (port > 65535) {
      cs.warnings.push_back(fmt::format(R"(port "{}" is out of range, ignoring)", in.string()));
      return;
    }
    cs.port = static_cast<std::uint16_t>(port);
  }
};
} // namespace priv

namespace
{
void
parse_option(std::string& receiver,
             const std::string& /* name */,
             const std::string& value,
             std::vector<std::string>& /* warnings */)
{
  receiver = string_codec::url_decode(value);
}

void
parse_option(bool& receiver,
             const std::string& name,
             const std::string& value,
             std::vector<std::string>& warnings)
{
  if (value == "true" || value == "yes" || value == "on") {
    receiver = true;
  } else if (value == "false" || value == "no" || value == "off") {
    receiver = false;
  } else {
    warnings.push_back(fmt::format(
      R"(unable to parse "{}" parameter in connection string (value "{}" cannot be interpreted as a boolean))",
      name,
      value));
  }
}

void
parse_option(std::size_t& receiver,
             const std::string& name,
             const std::string& value,
             std::vector<std::string>& warnings)
{
  std::size_t parsed{};
  try {
    parsed = std::stoull(value, nullptr, 10);
  } catch (const std::invalid_argument& ex1) {
    warnings.push_back(fmt::format(
      R"(unable to parse "{}" parameter in connection string (value "{}" is not a number): {})",
      name,
      value,
      ex1.what()));
    return;
  } catch (const std::out_of_range& ex2) {
    warnings.push_back(fmt::format(
      R"(unable to parse "{}" parameter in connection string (value "{}" is out of range): {})",
      name,
      value,
      ex2.what()));
    return;
  }
  if (parsed == 0) {
    warnings.push_back(fmt::format(
      R"(unable to parse "{}" parameter in connection string (value "{}" must be greater than zero))",
      name,
      value));
    return;
  }
  receiver = parsed;
}

void
extract_options(connection_string& connstr)
{
  auto current = connstr.options.build();
  for (const auto& [name, value] : connstr.params) {
    if (name == "partition_count") {
      /**
       * Number of partition key ranges of collections created by the in-process store.
       */
      parse_option(current.partition_count, name, value, connstr.warnings);
      connstr.options.partition_count(current.partition_count);
    } else if (name == "range_page_size") {
      /**
       * Number of partition key ranges per page of the listing of the in-process store.
       */
      parse_option(current.range_page_size, name, value, connstr.warnings);
      connstr.options.range_page_size(current.range_page_size);
    } else if (name == "change_feed_page_size") {
      parse_option(current.change_feed_page_size, name, value, connstr.warnings);
      connstr.options.change_feed_page_size(current.change_feed_page_size);
    } else if (name == "max_partition_range_pages") {
      parse_option(current.max_partition_range_pages, name, value, connstr.warnings);
      connstr.options.max_partition_range_pages(current.max_partition_range_pages);
    } else if (name == "prune_orphaned_checkpoints") {
      parse_option(current.prune_orphaned_checkpoints, name, value, connstr.warnings);
      connstr.options.prune_orphaned_checkpoints(current.prune_orphaned_checkpoints);
    } else if (name == "checkpoint_directory") {
      /**
       * Keep change feed checkpoints in files below this directory.
       */
      parse_option(current.checkpoint_directory, name, value, connstr.warnings);
      connstr.options.checkpoint_directory(current.checkpoint_directory);
    } else {
      connstr.warnings.push_back(
        fmt::format(R"(unknown parameter "{}" in connection string (value "{}"))", name, value));
    }
  }
}
} // namespace

connection_string
parse_connection_string(const std::string& input, instance_options options)
{
  connection_string res{};
  res.options = std::move(options);

  if (input.empty()) {
    res.error = "failed to parse connection string: empty input";
    return res;
  }

  auto in = tao::pegtl::memory_input(input, __FUNCTION__);
  try {
    tao::pegtl::parse<priv::grammar, priv::action>(in, res);
  } catch (const tao::pegtl::parse_error& e) {
    for (const auto& position : e.positions()) {
      if (position.source == __FUNCTION__) {
        res.error = fmt::format("failed to parse connection string (column: {}, trailer: \"{}\")",
                                position.column,
                                input.substr(position.byte));
        break;
      }
    }
    if (!res.error) {
      res.error = e.what();
    }
  }
  extract_options(res);
  return res;
}
} // namespace fluentdb::core::utils
