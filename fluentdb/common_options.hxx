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

#include <chrono>
#include <optional>

namespace fluentdb
{
/**
 * Options shared by every operation. Derived option classes return themselves from setters so
 * calls can be chained.
 */
template<typename derived_class>
class common_options
{
public:
  /**
   * Upper bound for the whole operation. When it elapses, the operation completes with
   * errc::common::ambiguous_timeout.
   */
  auto timeout(const std::chrono::milliseconds timeout) -> derived_class&
  {
    timeout_ = timeout;
    return self();
  }

  struct built {
    const std::optional<std::chrono::milliseconds> timeout;
  };

protected:
  [[nodiscard]] auto build_common_options() const -> built
  {
    return { timeout_ };
  }

  auto self() -> derived_class&
  {
    return *static_cast<derived_class*>(this);
  }

private:
  std::optional<std::chrono::milliseconds> timeout_{};
};

} // namespace fluentdb
