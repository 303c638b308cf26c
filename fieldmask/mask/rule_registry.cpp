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

#include "mask/rule_registry.hpp"

#include <absl/strings/str_cat.h>

#include "error/error.hpp"

namespace fieldmask {

void rule_registry::add(std::string_view type, std::string_view member,
                        mask_rule::ptr rule) {
  if (!rule) {
    throw illegal_argument{absl::StrCat("null rule for member '", member,
                                        "' of '", type, "'")};
  }

  rules_[type][member].emplace_back(std::move(rule));
  ++size_;
}

std::span<const mask_rule::ptr> rule_registry::find(
  std::string_view type, std::string_view member) const noexcept {
  auto members = rules_.find(type);

  if (members == rules_.end()) {
    return {};
  }

  auto rules = members->second.find(member);

  if (rules == members->second.end()) {
    return {};
  }

  return rules->second;
}

void rule_registry::merge(const rule_registry& other) {
  if (this == &other) {
    return;
  }

  for (auto& [type, members] : other.rules_) {
    auto& dst = rules_[type];
    for (auto& [member, rules] : members) {
      auto& dst_rules = dst[member];
      dst_rules.insert(dst_rules.end(), rules.begin(), rules.end());
      size_ += rules.size();
    }
  }
}

bool rule_registry::visit(const visitor_f& visitor) const {
  for (auto& [type, members] : rules_) {
    for (auto& [member, rules] : members) {
      for (auto& rule : rules) {
        if (!visitor(type, member, *rule)) {
          return false;
        }
      }
    }
  }
  return true;
}

}  // namespace fieldmask
