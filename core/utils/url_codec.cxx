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

#include "url_codec.hxx"

#include <cctype>

namespace fluentdb::core::utils::string_codec
{
namespace
{
auto
hex_value(char c) -> int
{
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}

auto
is_safe(char c) -> bool
{
  return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '-' || c == '_' || c == '~';
}
} // namespace

auto
url_decode(const std::string& src) -> std::string
{
  std::string result;
  result.reserve(src.size());
  for (std::size_t i = 0; i < src.size(); ++i) {
    if (src[i] == '%' && i + 2 < src.size()) {
      auto high = hex_value(src[i + 1]);
      auto low = hex_value(src[i + 2]);
      if (high >= 0 && low >= 0) {
        result.push_back(static_cast<char>((high << 4) | low));
        i += 2;
        continue;
      }
    }
    result.push_back(src[i]);
  }
  return result;
}

auto
path_escape(const std::string& src) -> std::string
{
  static constexpr char digits[] = "0123456789ABCDEF";

  std::string result;
  result.reserve(src.size());
  for (auto c : src) {
    if (is_safe(c)) {
      result.push_back(c);
    } else {
      auto byte = static_cast<unsigned char>(c);
      result.push_back('%');
      result.push_back(digits[byte >> 4U]);
      result.push_back(digits[byte & 0x0fU]);
    }
  }
  return result;
}
} // namespace fluentdb::core::utils::string_codec
