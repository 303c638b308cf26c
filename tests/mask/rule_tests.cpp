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

#include "models.hpp"
#include "tests_shared.hpp"

namespace {

fieldmask::mask_scope MakeScope(const fieldmask::calling_context* context,
                                std::string_view policy,
                                fieldmask::type_info via = {}) {
  return fieldmask::mask_scope{
    .context = context,
    .owner = fieldmask::composite_type<tests::Secret>(),
    .via = via,
    .policy = policy,
    .member = "Code",
    .depth = via ? 1U : 0U,
  };
}

}  // namespace

TEST(MaskRuleTest, CheckConsts) {
  static_assert("condition" == fieldmask::type<fieldmask::by_condition>::name());
  static_assert("predicate" == fieldmask::type<fieldmask::by_predicate>::name());
  static_assert("PublicApi" == fieldmask::type<tests::PublicApi>::name());

  tests::PublicApi ctx;
  ASSERT_EQ(fieldmask::type<tests::PublicApi>::get(), ctx.type());
}

TEST(MaskRuleTest, Always) {
  auto rule = fieldmask::mask_always();
  ASSERT_NE(nullptr, rule);
  ASSERT_EQ(fieldmask::type<fieldmask::by_condition>::id(), rule->type());

  tests::AdminApi ctx;
  ASSERT_TRUE(rule->match(MakeScope(nullptr, "default")));
  ASSERT_TRUE(rule->match(MakeScope(&ctx, "public")));
  ASSERT_TRUE(rule->match(MakeScope(&ctx, "")));
}

TEST(MaskRuleTest, ForPolicy) {
  auto rule = fieldmask::mask_for_policy({"public", "partner"});

  ASSERT_TRUE(rule->match(MakeScope(nullptr, "public")));
  ASSERT_TRUE(rule->match(MakeScope(nullptr, "partner")));
  ASSERT_FALSE(rule->match(MakeScope(nullptr, "default")));
  ASSERT_FALSE(rule->match(MakeScope(nullptr, "Public")));
  ASSERT_FALSE(rule->match(MakeScope(nullptr, "")));
}

TEST(MaskRuleTest, ForEndpoint) {
  auto rule = fieldmask::mask_for_endpoint<tests::PublicApi>();
  tests::PublicApi public_api;
  tests::AdminApi admin_api;

  ASSERT_TRUE(rule->match(MakeScope(&public_api, "default")));
  ASSERT_TRUE(rule->match(MakeScope(&public_api, "public")));
  ASSERT_FALSE(rule->match(MakeScope(&admin_api, "default")));

  // rules relying on a context never match without one
  ASSERT_FALSE(rule->match(MakeScope(nullptr, "default")));
}

TEST(MaskRuleTest, ForEndpointAndPolicy) {
  auto rule =
    fieldmask::mask_for_endpoint<tests::PublicApi, tests::AdminApi>(
      {"public"});
  tests::PublicApi public_api;
  tests::AdminApi admin_api;

  ASSERT_TRUE(rule->match(MakeScope(&public_api, "public")));
  ASSERT_TRUE(rule->match(MakeScope(&admin_api, "public")));
  ASSERT_FALSE(rule->match(MakeScope(&admin_api, "default")));
  ASSERT_FALSE(rule->match(MakeScope(nullptr, "public")));
}

TEST(MaskRuleTest, ByOwnerAndVia) {
  const auto account = fieldmask::composite_type<tests::Account>();
  const auto ledger = fieldmask::composite_type<tests::Ledger>();

  auto via_account = fieldmask::mask_when({.via = {"Account"}});
  ASSERT_TRUE(via_account->match(MakeScope(nullptr, "default", account)));
  ASSERT_FALSE(via_account->match(MakeScope(nullptr, "default", ledger)));
  // not reached through anything
  ASSERT_FALSE(via_account->match(MakeScope(nullptr, "default")));

  auto secret_owner = fieldmask::mask_when({.owners = {"Secret"}});
  ASSERT_TRUE(secret_owner->match(MakeScope(nullptr, "default")));
  ASSERT_TRUE(secret_owner->match(MakeScope(nullptr, "default", ledger)));

  auto other_owner = fieldmask::mask_when({.owners = {"Account"}});
  ASSERT_FALSE(other_owner->match(MakeScope(nullptr, "default", account)));
}

TEST(MaskRuleTest, AllConstraintsMustHold) {
  auto rule = fieldmask::mask_when({.endpoints = {"PublicApi"},
                                    .policies = {"public"},
                                    .owners = {"Secret"},
                                    .via = {"Account"}});
  const auto account = fieldmask::composite_type<tests::Account>();
  const auto ledger = fieldmask::composite_type<tests::Ledger>();
  tests::PublicApi public_api;

  ASSERT_TRUE(rule->match(MakeScope(&public_api, "public", account)));
  ASSERT_FALSE(rule->match(MakeScope(&public_api, "default", account)));
  ASSERT_FALSE(rule->match(MakeScope(&public_api, "public", ledger)));
  ASSERT_FALSE(rule->match(MakeScope(nullptr, "public", account)));
}

TEST(MaskRuleTest, OptionsEquality) {
  fieldmask::by_condition lhs{{.policies = {"public"}}};
  fieldmask::by_condition rhs;
  ASSERT_FALSE(lhs.options() == rhs.options());

  rhs.mutable_options()->policies.emplace("public");
  ASSERT_TRUE(lhs.options() == rhs.options());
}

TEST(MaskRuleTest, Predicate) {
  std::vector<std::string> members;
  auto rule = fieldmask::mask_if(
    [&members](const fieldmask::mask_scope& scope) {
      members.emplace_back(scope.member);
      return scope.depth > 0;
    });
  ASSERT_EQ(fieldmask::type<fieldmask::by_predicate>::id(), rule->type());

  ASSERT_FALSE(rule->match(MakeScope(nullptr, "default")));
  ASSERT_TRUE(rule->match(MakeScope(
    nullptr, "default", fieldmask::composite_type<tests::Account>())));
  ASSERT_EQ((std::vector<std::string>{"Code", "Code"}), members);

  // empty predicate never matches
  fieldmask::by_predicate empty{nullptr};
  ASSERT_FALSE(empty.match(MakeScope(nullptr, "default")));
}
