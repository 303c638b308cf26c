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

#include <functional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <absl/container/flat_hash_map.h>

#include "graph/node_traits.hpp"
#include "mask/rule.hpp"
#include "shared.hpp"

namespace fieldmask {

////////////////////////////////////////////////////////////////////////////////
/// @class rule_registry
/// @brief rules keyed by (composite type name, member name), consulted in
///        addition to the rules declared on the members themselves
/// @note not thread-safe while being populated, read-only access afterwards
///       is safe
////////////////////////////////////////////////////////////////////////////////
class rule_registry {
 public:
  using rules_t = std::vector<mask_rule::ptr>;
  using visitor_f = std::function<bool(std::string_view type,
                                       std::string_view member,
                                       const mask_rule& rule)>;

  void add(std::string_view type, std::string_view member,
           mask_rule::ptr rule);

  template<typename Composite>
  void add(std::string_view member, mask_rule::ptr rule) {
    add(composite_type<Composite>().name(), member, std::move(rule));
  }

  std::span<const mask_rule::ptr> find(std::string_view type,
                                       std::string_view member) const noexcept;

  // append all rules of 'other'
  void merge(const rule_registry& other);

  // visit rules grouped by type and member, terminate early if visitor
  // returns false
  bool visit(const visitor_f& visitor) const;

  void clear() noexcept {
    rules_.clear();
    size_ = 0;
  }

  // total number of rules
  size_t size() const noexcept { return size_; }
  bool empty() const noexcept { return 0 == size_; }

 private:
  using members_t = absl::flat_hash_map<std::string, rules_t>;

  absl::flat_hash_map<std::string, members_t> rules_;
  size_t size_{0};
};

}  // namespace fieldmask
