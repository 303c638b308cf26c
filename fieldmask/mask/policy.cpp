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

#include "mask/policy.hpp"

#include <algorithm>

#include <absl/strings/str_cat.h>
#include <velocypack/Exception.h>
#include <velocypack/Iterator.h>
#include <velocypack/Parser.h>

#include "graph/composites.hpp"
#include "utils/log.hpp"
#include "utils/string.hpp"

namespace velocypack = arangodb::velocypack;

namespace {

using namespace fieldmask;

constexpr std::string_view kDefaultPolicyParam{"defaultPolicy"};
constexpr std::string_view kMaxDepthParam{"maxDepth"};
constexpr std::string_view kRulesParam{"rules"};
constexpr std::string_view kTypeParam{"type"};
constexpr std::string_view kMemberParam{"member"};
constexpr std::string_view kPoliciesParam{"policies"};
constexpr std::string_view kEndpointsParam{"endpoints"};
constexpr std::string_view kOwnersParam{"owners"};
constexpr std::string_view kViaParam{"via"};

// return slice as string for warning messages
std::string SliceToString(velocypack::Slice slice) noexcept {
  try {
    return slice.toJson();
  } catch (...) {
    return "<non-representable type>";
  }
}

bool ParseNames(velocypack::Slice slice, std::string_view key, size_t idx,
                by_condition_options::names_t& names) {
  const auto names_slice = slice.get(key);

  if (names_slice.isNone() || names_slice.isNull()) {
    return true;
  }

  if (!names_slice.isArray()) {
    FIELDMASK_LOG_WARN(absl::StrCat("Failed to read '", key, "' of rule #",
                                    idx, " as array of strings"));
    return false;
  }

  for (auto name : velocypack::ArrayIterator(names_slice)) {
    if (!name.isString()) {
      FIELDMASK_LOG_WARN(absl::StrCat("Invalid value '", SliceToString(name),
                                      "' in '", key, "' of rule #", idx,
                                      ", string expected"));
      return false;
    }
    names.emplace(name.stringView());
  }

  return true;
}

bool ParseString(velocypack::Slice slice, std::string_view key, size_t idx,
                 std::string& value) {
  const auto value_slice = slice.get(key);

  if (!value_slice.isString() || value_slice.stringView().empty()) {
    FIELDMASK_LOG_WARN(absl::StrCat("Failed to read mandatory '", key,
                                    "' of rule #", idx, " as string"));
    return false;
  }

  value = value_slice.stringView();
  return true;
}

bool ParseRule(velocypack::Slice slice, size_t idx, rule_definition& rule) {
  if (!slice.isObject()) {
    FIELDMASK_LOG_WARN(absl::StrCat("Rule #", idx, " is not an object"));
    return false;
  }

  if (!ParseString(slice, kTypeParam, idx, rule.type) ||
      !ParseString(slice, kMemberParam, idx, rule.member)) {
    return false;
  }

  auto* table = composites::get(rule.type);

  if (!table) {
    FIELDMASK_LOG_WARN(absl::StrCat("Rule #", idx,
                                    " refers to unregistered composite '",
                                    rule.type, "'"));
    return false;
  }

  if (!table->find(rule.member)) {
    FIELDMASK_LOG_WARN(absl::StrCat("Rule #", idx, " refers to unknown member '",
                                    rule.member, "' of composite '",
                                    rule.type, "'"));
    return false;
  }

  auto& options = rule.options;
  return ParseNames(slice, kPoliciesParam, idx, options.policies) &&
         ParseNames(slice, kEndpointsParam, idx, options.endpoints) &&
         ParseNames(slice, kOwnersParam, idx, options.owners) &&
         ParseNames(slice, kViaParam, idx, options.via);
}

bool ParsePolicy(velocypack::Slice slice, policy_config& config) {
  if (!slice.isObject()) {
    FIELDMASK_LOG_WARN(absl::StrCat("Policy definition '",
                                    SliceToString(slice),
                                    "' is not an object"));
    return false;
  }

  if (const auto policy_slice = slice.get(kDefaultPolicyParam);
      !policy_slice.isNone()) {
    if (!policy_slice.isString()) {
      FIELDMASK_LOG_WARN(absl::StrCat("Failed to read '", kDefaultPolicyParam,
                                      "' as string"));
      return false;
    }
    config.default_policy = policy_slice.stringView();
  }

  if (const auto depth_slice = slice.get(kMaxDepthParam);
      !depth_slice.isNone()) {
    if (!depth_slice.isNumber<size_t>()) {
      FIELDMASK_LOG_WARN(absl::StrCat("Failed to read '", kMaxDepthParam,
                                      "' as unsigned integer"));
      return false;
    }
    config.max_depth = depth_slice.getNumber<size_t>();
  }

  const auto rules_slice = slice.get(kRulesParam);

  if (rules_slice.isNone()) {
    return true;
  }

  if (!rules_slice.isArray()) {
    FIELDMASK_LOG_WARN(absl::StrCat("Failed to read '", kRulesParam,
                                    "' as array"));
    return false;
  }

  size_t idx = 0;
  for (auto rule_slice : velocypack::ArrayIterator(rules_slice)) {
    auto& rule = config.rules.emplace_back();
    if (!ParseRule(rule_slice, idx++, rule)) {
      return false;
    }
  }

  return true;
}

void AddNames(velocypack::Builder* out, std::string_view key,
              const by_condition_options::names_t& names) {
  if (names.empty()) {
    return;
  }

  std::vector<std::string_view> sorted{names.begin(), names.end()};
  std::sort(sorted.begin(), sorted.end());

  velocypack::ArrayBuilder array{out, key};
  for (auto name : sorted) {
    out->add(velocypack::Value{name});
  }
}

}  // namespace

namespace fieldmask {

void policy_config::apply(rule_registry& registry) const {
  for (auto& rule : rules) {
    registry.add(rule.type, rule.member, mask_when(rule.options));
  }
}

masker_options policy_config::options(const rule_registry* registry) const {
  masker_options opts;
  opts.registry = registry;
  opts.default_policy = default_policy;
  opts.max_depth = max_depth;
  return opts;
}

namespace policy {

bool from_vpack(velocypack::Slice slice, policy_config& config) {
  try {
    policy_config parsed;
    if (!ParsePolicy(slice, parsed)) {
      return false;
    }
    config = std::move(parsed);
    return true;
  } catch (const velocypack::Exception& ex) {
    FIELDMASK_LOG_WARN(absl::StrCat(
      "Caught error '", ex.what(), "' while reading policy from VPack"));
  }
  return false;
}

bool from_json(std::string_view json, policy_config& config) {
  if (IsNull(json)) {
    FIELDMASK_LOG_WARN("Null arguments while reading policy from JSON");
    return false;
  }

  try {
    auto vpack = velocypack::Parser::fromJson(json.data(), json.size());
    return from_vpack(vpack->slice(), config);
  } catch (const velocypack::Exception& ex) {
    FIELDMASK_LOG_WARN(absl::StrCat(
      "Caught error '", ex.what(), "' while reading policy from JSON"));
  }
  return false;
}

void to_vpack(const policy_config& config, velocypack::Builder* out) {
  velocypack::ObjectBuilder root{out};
  out->add(kDefaultPolicyParam, velocypack::Value{config.default_policy});
  out->add(kMaxDepthParam, velocypack::Value{config.max_depth});

  velocypack::ArrayBuilder rules{out, kRulesParam};
  for (auto& rule : config.rules) {
    velocypack::ObjectBuilder object{out};
    out->add(kTypeParam, velocypack::Value{rule.type});
    out->add(kMemberParam, velocypack::Value{rule.member});
    AddNames(out, kPoliciesParam, rule.options.policies);
    AddNames(out, kEndpointsParam, rule.options.endpoints);
    AddNames(out, kOwnersParam, rule.options.owners);
    AddNames(out, kViaParam, rule.options.via);
  }
}

std::string to_json(const policy_config& config) {
  velocypack::Builder builder;
  to_vpack(config, &builder);
  return builder.slice().toJson();
}

}  // namespace policy
}  // namespace fieldmask
