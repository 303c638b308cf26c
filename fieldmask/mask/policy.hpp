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
#include <vector>

#include <velocypack/Builder.h>
#include <velocypack/Slice.h>

#include "mask/masker.hpp"
#include "mask/rule.hpp"
#include "mask/rule_registry.hpp"
#include "shared.hpp"

namespace fieldmask {

// Declarative rule bound to a member of a registered composite
struct rule_definition {
  std::string type;
  std::string member;
  by_condition_options options;

  bool operator==(const rule_definition& rhs) const noexcept {
    return type == rhs.type && member == rhs.member && options == rhs.options;
  }
};

////////////////////////////////////////////////////////////////////////////////
/// @brief textual rule set, e.g.
///        {
///          "defaultPolicy": "default",
///          "maxDepth": 64,
///          "rules": [ { "type": "Category", "member": "Name",
///                       "policies": [ "public" ] } ]
///        }
///        "type" and "member" are mandatory, "policies", "endpoints",
///        "owners" and "via" are optional arrays of strings
////////////////////////////////////////////////////////////////////////////////
struct policy_config {
  std::vector<rule_definition> rules;
  std::string default_policy{"default"};
  size_t max_depth{0};

  // register all rules in 'registry'
  void apply(rule_registry& registry) const;

  // masker options evaluating 'registry', which must outlive the masker
  masker_options options(const rule_registry* registry) const;
};

namespace policy {

// return false and leave 'config' untouched on malformed input
bool from_vpack(arangodb::velocypack::Slice slice, policy_config& config);
bool from_json(std::string_view json, policy_config& config);

// normalized definition, names within a rule are sorted
void to_vpack(const policy_config& config,
              arangodb::velocypack::Builder* out);
std::string to_json(const policy_config& config);

}  // namespace policy
}  // namespace fieldmask
