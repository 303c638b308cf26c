////////////////////////////////////////////////////////////////////////////////
/// DISCLAIMER
///
/// Copyright 2024 ArangoDB GmbH, Cologne, Germany
///
/// Licensed under the Apache License, Version 2.0 (the "License");
/// you may not use this file except in compliance with the License.
/// You may obtain a copy of the License at
///
///     http://www.apache.org/licenses/LICENSE-2.0
///
/// Unless required by applicable law or agreed to in writing, software
/// distributed under the License is distributed on an "AS IS" BASIS,
/// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
/// See the License for the specific language governing permissions and
/// limitations under the License.
///
/// Copyright holder is ArangoDB GmbH, Cologne, Germany
////////////////////////////////////////////////////////////////////////////////

#pragma once

#include <string>
#include <string_view>

#include "mask/clone.hpp"
#include "mask/context.hpp"
#include "mask/rule_registry.hpp"
#include "mask/walker.hpp"
#include "shared.hpp"
#include "utils/string.hpp"

namespace fieldmask {

struct masker_options {
  // additional rules, must outlive the masker
  const rule_registry* registry = nullptr;
  // policy used when the caller does not name one
  std::string default_policy = "default";
  // maximum composite nesting, 0 == unbounded
  size_t max_depth = 0;
};

////////////////////////////////////////////////////////////////////////////////
/// @class masker
/// @brief clones a value graph and erases the members matching the rules
///        for the calling context and policy
/// @note stateless between calls, a single instance may be shared across
///       threads
////////////////////////////////////////////////////////////////////////////////
class masker {
 public:
  using options = masker_options;

  masker() = default;
  explicit masker(options opts) noexcept : opts_(std::move(opts)) {}

  // rules relying on a calling context never match
  template<typename T>
  T mask(const T& data, std::string_view policy = {},
         mask_stats* stats = nullptr) const {
    return mask_impl(data, nullptr, policy, stats);
  }

  template<typename T>
  T mask(const T& data, const calling_context& context,
         std::string_view policy = {}, mask_stats* stats = nullptr) const {
    return mask_impl(data, &context, policy, stats);
  }

  // effective policy name for the specified one
  std::string_view policy(std::string_view policy) const noexcept {
    return IsNull(policy) ? std::string_view{opts_.default_policy} : policy;
  }

  const options& opts() const noexcept { return opts_; }

 private:
  template<typename T>
  T mask_impl(const T& data, const calling_context* context,
              std::string_view policy, mask_stats* stats) const {
    const auto effective_policy = this->policy(policy);
    log_begin(context, effective_policy);

    auto result = clone(data);

    walk_state state{context, effective_policy, opts_.registry,
                     opts_.max_depth};
    walk_node(result, state);

    log_end(state);
    if (stats) {
      *stats = state.stats();
    }

    return result;
  }

  static void log_begin(const calling_context* context,
                        std::string_view policy);
  static void log_end(const walk_state& state);

  options opts_;
};

template<typename T>
T mask(const T& data, std::string_view policy = {}) {
  return masker{}.mask(data, policy);
}

template<typename T>
T mask(const T& data, const calling_context& context,
       std::string_view policy = {}) {
  return masker{}.mask(data, context, policy);
}

}  // namespace fieldmask
