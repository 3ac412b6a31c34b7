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

#include <functional>
#include <memory>
#include <type_traits>
#include <utility>

namespace fluentdb::core::utils
{
/**
 * Type-erased callable that only requires the target to be move constructible, so handlers may
 * own promises, cursors and other move-only state.
 */
template<typename Signature>
class movable_function;

template<typename Result, typename... Args>
class movable_function<Result(Args...)>
{
  struct callable_base {
    virtual ~callable_base() = default;
    virtual auto invoke(Args&&... args) -> Result = 0;
  };

  template<typename Functor>
  struct callable : callable_base {
    Functor fn;

    template<typename F>
    explicit callable(F&& f)
      : fn(std::forward<F>(f))
    {
    }

    auto invoke(Args&&... args) -> Result override
    {
      return std::invoke(fn, std::forward<Args>(args)...);
    }
  };

public:
  movable_function() noexcept = default;
  movable_function(std::nullptr_t) noexcept
  {
  }

  template<typename Functor,
           typename = std::enable_if_t<!std::is_same_v<std::decay_t<Functor>, movable_function>>>
  movable_function(Functor&& f)
    : fn_{ std::make_unique<callable<std::decay_t<Functor>>>(std::forward<Functor>(f)) }
  {
  }

  movable_function(const movable_function&) = delete;
  auto operator=(const movable_function&) -> movable_function& = delete;
  movable_function(movable_function&& other) noexcept = default;
  auto operator=(movable_function&& other) noexcept -> movable_function& = default;
  ~movable_function() = default;

  auto operator=(std::nullptr_t) noexcept -> movable_function&
  {
    fn_.reset();
    return *this;
  }

  explicit operator bool() const noexcept
  {
    return fn_ != nullptr;
  }

  auto operator()(Args... args) -> Result
  {
    return fn_->invoke(std::forward<Args>(args)...);
  }

private:
  std::unique_ptr<callable_base> fn_{};
};
} // namespace fluentdb::core::utils
