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
#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>

#include <absl/container/flat_hash_set.h>

#include "mask/context.hpp"
#include "shared.hpp"
#include "utils/type_id.hpp"

namespace fieldmask {

////////////////////////////////////////////////////////////////////////////////
/// @brief everything a rule may look at when deciding whether a member is
///        erased
////////////////////////////////////////////////////////////////////////////////
struct mask_scope {
  // nullptr if the caller did not supply a context
  const calling_context* context = nullptr;
  // runtime type of the composite holding the member
  type_info owner;
  // composite through which 'owner' was reached, invalid at the root
  type_info via;
  // effective policy name, never null
  std::string_view policy;
  std::string_view member;
  // number of composites above 'owner'
  size_t depth = 0;
};

// Base class for all mask rules
class mask_rule {
 public:
  using ptr = std::shared_ptr<const mask_rule>;

  virtual ~mask_rule() = default;

  // true if the member must be erased
  virtual bool match(const mask_scope& scope) const = 0;

  virtual type_info::type_id type() const noexcept = 0;
};

template<typename Type>
class mask_rule_with_type : public mask_rule {
 public:
  using rule_type = Type;

  type_info::type_id type() const noexcept final {
    return fieldmask::type<Type>::id();
  }
};

struct by_condition_options {
  using names_t = absl::flat_hash_set<std::string>;

  // calling context type names, an empty set matches any context
  // including none
  names_t endpoints;
  // effective policy names
  names_t policies;
  // owner type names
  names_t owners;
  // type names of the composite the owner was reached through
  names_t via;

  bool operator==(const by_condition_options& rhs) const noexcept {
    return endpoints == rhs.endpoints && policies == rhs.policies &&
           owners == rhs.owners && via == rhs.via;
  }
};

////////////////////////////////////////////////////////////////////////////////
/// @class by_condition
/// @brief declarative rule, matches if every non-empty constraint is met
////////////////////////////////////////////////////////////////////////////////
class by_condition final : public mask_rule_with_type<by_condition> {
 public:
  using options_type = by_condition_options;

  static constexpr std::string_view type_name() noexcept {
    return "condition";
  }

  by_condition() = default;
  explicit by_condition(options_type options) noexcept
    : options_(std::move(options)) {}

  bool match(const mask_scope& scope) const override;

  const options_type& options() const noexcept { return options_; }
  options_type* mutable_options() noexcept { return &options_; }

 private:
  options_type options_;
};

////////////////////////////////////////////////////////////////////////////////
/// @class by_predicate
/// @brief rule backed by an arbitrary function
////////////////////////////////////////////////////////////////////////////////
class by_predicate final : public mask_rule_with_type<by_predicate> {
 public:
  using function_type = std::function<bool(const mask_scope&)>;

  static constexpr std::string_view type_name() noexcept {
    return "predicate";
  }

  explicit by_predicate(function_type predicate) noexcept
    : predicate_(std::move(predicate)) {}

  bool match(const mask_scope& scope) const override {
    return predicate_ && predicate_(scope);
  }

 private:
  function_type predicate_;
};

// erase the member unconditionally
mask_rule::ptr mask_always();

// erase the member under any of the specified policies
mask_rule::ptr mask_for_policy(std::initializer_list<std::string_view> policies);

// erase the member when described by the specified options
mask_rule::ptr mask_when(by_condition_options options);

mask_rule::ptr mask_if(by_predicate::function_type predicate);

// erase the member when requested by any of the specified context types
// and, if any are given, under one of the specified policies
template<typename... Contexts>
mask_rule::ptr mask_for_endpoint(
  std::initializer_list<std::string_view> policies = {}) {
  by_condition_options options;
  (options.endpoints.emplace(type<Contexts>::name()), ...);
  for (auto policy : policies) {
    options.policies.emplace(policy);
  }
  return mask_when(std::move(options));
}

}  // namespace fieldmask
