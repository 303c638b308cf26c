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

#include "mask/rule.hpp"

namespace fieldmask {
namespace {

bool contains(const by_condition_options::names_t& names,
              std::string_view name) {
  return names.empty() || names.contains(name);
}

}  // namespace

bool by_condition::match(const mask_scope& scope) const {
  if (!options_.endpoints.empty()) {
    if (!scope.context ||
        !options_.endpoints.contains(scope.context->type().name())) {
      return false;
    }
  }

  if (!options_.via.empty()) {
    if (!scope.via || !options_.via.contains(scope.via.name())) {
      return false;
    }
  }

  return contains(options_.policies, scope.policy) &&
         contains(options_.owners, scope.owner.name());
}

mask_rule::ptr mask_always() {
  return std::make_shared<by_condition>();
}

mask_rule::ptr mask_for_policy(
  std::initializer_list<std::string_view> policies) {
  by_condition_options options;
  for (auto policy : policies) {
    options.policies.emplace(policy);
  }
  return mask_when(std::move(options));
}

mask_rule::ptr mask_when(by_condition_options options) {
  return std::make_shared<by_condition>(std::move(options));
}

mask_rule::ptr mask_if(by_predicate::function_type predicate) {
  return std::make_shared<by_predicate>(std::move(predicate));
}

}  // namespace fieldmask
