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

#include "uuid.hxx"

#include <random>

namespace fluentdb::core::uuid
{
auto
random() -> uuid_t
{
  static thread_local std::mt19937_64 gen{ std::random_device()() };
  std::uniform_int_distribution<std::uint64_t> dis;

  uuid_t uuid{};
  for (std::size_t half = 0; half < 2; ++half) {
    auto bits = dis(gen);
    for (std::size_t i = 0; i < 8; ++i) {
      uuid[half * 8 + i] = static_cast<std::uint8_t>(bits >> (i * 8U));
    }
  }

  // version 4, RFC 4122 variant
  uuid[6] = static_cast<std::uint8_t>((uuid[6] & 0x0fU) | 0x40U);
  uuid[8] = static_cast<std::uint8_t>((uuid[8] & 0x3fU) | 0x80U);
  return uuid;
}

auto
to_string(const uuid_t& uuid) -> std::string
{
  static constexpr char digits[] = "0123456789abcdef";

  std::string result;
  result.reserve(36);
  for (std::size_t i = 0; i < uuid.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) {
      result.push_back('-');
    }
    result.push_back(digits[uuid[i] >> 4U]);
    result.push_back(digits[uuid[i] & 0x0fU]);
  }
  return result;
}
} // namespace fluentdb::core::uuid
