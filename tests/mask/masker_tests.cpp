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

#include "mask/masker.hpp"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "error/error.hpp"
#include "models.hpp"
#include "tests_shared.hpp"

namespace {

tests::Category MakeCategory() {
  tests::Category root;
  root.Name = "A";
  root.Children.emplace_back().Name = "A_1";
  return root;
}

}  // namespace

TEST(MaskerTest, CategoryExample) {
  const auto input = MakeCategory();

  auto masked = fieldmask::mask(input, "public");

  tests::Category expected;
  expected.Children.emplace_back();
  ASSERT_EQ(expected, masked);
  ASSERT_FALSE(masked.Name.has_value());
  ASSERT_EQ(1, masked.Children.size());
  ASSERT_FALSE(masked.Children.front().Name.has_value());
  ASSERT_TRUE(masked.Children.front().Children.empty());

  // original untouched
  ASSERT_EQ("A", input.Name);
  ASSERT_EQ("A_1", input.Children.front().Name);
}

TEST(MaskerTest, NonMutation) {
  tests::Document doc;
  doc.Id = "doc-1";
  doc.CreatedBy = "admin";
  doc.Body = "body";
  doc.Tags["first"] = MakeCategory();
  const auto snapshot = doc;
  const auto* first_tag = &doc.Tags.at("first");
  const auto* first_child = &first_tag->Children.front();

  auto masked = fieldmask::mask(doc, "public");

  ASSERT_EQ(snapshot, doc);
  ASSERT_EQ(first_tag, &doc.Tags.at("first"));
  ASSERT_EQ(first_child, &doc.Tags.at("first").Children.front());
  ASSERT_NE(first_tag, &masked.Tags.at("first"));

  ASSERT_EQ("", masked.CreatedBy);
  ASSERT_EQ("doc-1", masked.Id);
  ASSERT_FALSE(masked.Tags.at("first").Name.has_value());
}

TEST(MaskerTest, NonMutationOfSharedNodes) {
  auto root = tests::make_node("root", "root-token");
  auto child = tests::make_node("child", "child-token");
  child->Parent = root;
  root->Next.emplace_back(child);

  auto masked = fieldmask::mask(root, "public");

  ASSERT_NE(root, masked);
  ASSERT_EQ("root-token", root->Token);
  ASSERT_EQ("child-token", child->Token);
  ASSERT_EQ(child, root->Next.front());

  ASSERT_EQ("", masked->Token);
  ASSERT_EQ("", masked->Next.front()->Token);
  ASSERT_EQ(masked, masked->Next.front()->Parent.lock());
}

TEST(MaskerTest, NoOpPolicyClonesOnly) {
  const auto input = MakeCategory();

  fieldmask::mask_stats stats;
  auto masked = fieldmask::masker{}.mask(input, "internal", &stats);

  ASSERT_EQ(input, masked);
  ASSERT_NE(&input.Children.front(), &masked.Children.front());
  ASSERT_EQ(0, stats.erased);
  ASSERT_EQ(2, stats.composites);
  ASSERT_EQ(4, stats.members);
}

TEST(MaskerTest, DefaultPolicy) {
  const auto input = MakeCategory();

  // null policy selects the default one
  ASSERT_EQ(input, fieldmask::mask(input));

  fieldmask::masker masker{{.default_policy = "public"}};
  ASSERT_EQ("public", masker.policy({}));
  ASSERT_EQ("", masker.policy(""));
  ASSERT_EQ("internal", masker.policy("internal"));

  auto masked = masker.mask(input);
  ASSERT_FALSE(masked.Name.has_value());

  // empty name is a regular policy
  ASSERT_EQ(input, masker.mask(input, ""));
}

TEST(MaskerTest, DepthSensitivity) {
  const tests::Secret secret{.Code = "1234", .Label = "pin"};
  const tests::Account account{.Owner = "owner", .Credentials = secret};
  const tests::Ledger ledger{.Title = "ledger", .Credentials = secret};

  auto masked_account = fieldmask::mask(account);
  ASSERT_EQ("", masked_account.Credentials.Code);
  ASSERT_EQ("pin", masked_account.Credentials.Label);

  auto masked_ledger = fieldmask::mask(ledger);
  ASSERT_EQ("1234", masked_ledger.Credentials.Code);
  ASSERT_EQ("pin", masked_ledger.Credentials.Label);

  // not reached through anything
  ASSERT_EQ(secret, fieldmask::mask(secret));
}

TEST(MaskerTest, DepthSensitivityOfSharedNode) {
  auto secret = std::make_shared<tests::Secret>();
  secret->Code = "1234";
  secret->Label = "pin";
  tests::Keyring keyring;
  keyring.Old = {.Name = "old", .Credentials = secret};
  keyring.Current = {.Name = "current", .Credentials = secret};

  fieldmask::rule_registry registry;
  registry.add<tests::Secret>("Code",
                              fieldmask::mask_when({.via = {"Vault"}}));
  fieldmask::masker masker{{.registry = &registry}};

  fieldmask::mask_stats stats;
  auto masked = masker.mask(keyring, "default", &stats);

  // one instance reached through both parents, erased through 'Vault'
  ASSERT_EQ(masked.Old.Credentials, masked.Current.Credentials);
  ASSERT_NE(secret, masked.Current.Credentials);
  ASSERT_EQ("", masked.Current.Credentials->Code);
  ASSERT_EQ("pin", masked.Current.Credentials->Label);
  ASSERT_EQ(1, stats.erased);
  ASSERT_EQ(0, stats.cycles_skipped);
  ASSERT_EQ("1234", secret->Code);

  // the same instance reached only through 'Archive'
  keyring.Current.Credentials.reset();
  auto archived = masker.mask(keyring, "default");
  ASSERT_EQ("1234", archived.Old.Credentials->Code);
}

TEST(MaskerTest, SequencePassThrough) {
  std::vector<tests::Category> input(3);
  input[0].Name = "first";
  input[1].Name = "second";
  input[2].Name = "third";

  fieldmask::rule_registry registry;
  registry.add<tests::Category>(
    "Name", fieldmask::mask_if([](const fieldmask::mask_scope&) {
      static size_t calls = 0;
      return 1 == calls++;
    }));

  fieldmask::masker masker{{.registry = &registry}};
  auto masked = masker.mask(input, "default");

  ASSERT_EQ(3, masked.size());
  ASSERT_EQ("first", masked[0].Name);
  ASSERT_FALSE(masked[1].Name.has_value());
  ASSERT_EQ("third", masked[2].Name);
  ASSERT_EQ("second", input[1].Name);
}

TEST(MaskerTest, AssociativeSequence) {
  std::map<std::string, tests::Category> input;
  input["a"].Name = "A";
  input["b"].Name = "B";

  auto masked = fieldmask::mask(input, "public");

  ASSERT_EQ(2, masked.size());
  ASSERT_FALSE(masked.at("a").Name.has_value());
  ASSERT_FALSE(masked.at("b").Name.has_value());
  ASSERT_EQ("A", input.at("a").Name);
}

TEST(MaskerTest, ReadOnlySkip) {
  const tests::Profile profile{7, "user@example.com", "555-0100"};

  fieldmask::mask_stats stats;
  auto masked = fieldmask::masker{}.mask(profile, "public", &stats);

  ASSERT_EQ("user@example.com", masked.email());
  ASSERT_EQ("", masked.phone());
  ASSERT_EQ(1, stats.readonly_skipped);
  ASSERT_EQ("555-0100", profile.phone());
}

TEST(MaskerTest, CallingContext) {
  tests::Envelope envelope;
  envelope.Content.Data = "payload";

  // rules relying on a context never match without one
  ASSERT_EQ("payload", fieldmask::mask(envelope).Content.Data);

  tests::AdminApi admin;
  ASSERT_EQ("payload", fieldmask::mask(envelope, admin).Content.Data);

  tests::PublicApi public_api;
  ASSERT_EQ("", fieldmask::mask(envelope, public_api).Content.Data);
  ASSERT_EQ("", fieldmask::mask(envelope, public_api, "any").Content.Data);
  ASSERT_EQ("payload", envelope.Content.Data);
}

TEST(MaskerTest, RegistryRules) {
  const tests::Account account{.Owner = "owner",
                               .Credentials = {.Code = "1", .Label = "x"}};

  fieldmask::rule_registry registry;
  registry.add<tests::Account>(
    "Owner", fieldmask::mask_for_endpoint<tests::AdminApi>({"audit"}));
  fieldmask::masker masker{{.registry = &registry}};

  tests::AdminApi admin;
  tests::PublicApi public_api;
  ASSERT_EQ("", masker.mask(account, admin, "audit").Owner);
  ASSERT_EQ("owner", masker.mask(account, admin, "default").Owner);
  ASSERT_EQ("owner", masker.mask(account, public_api, "audit").Owner);

  // declared rules still apply
  ASSERT_EQ("", masker.mask(account, admin, "audit").Credentials.Code);
}

TEST(MaskerTest, RegistryRulesOnInheritedMembers) {
  tests::Revision revision;
  revision.Id = "rev-1";
  revision.CreatedBy = "admin";
  revision.Body = "body";
  revision.Number = 3;

  fieldmask::rule_registry registry;
  registry.add<tests::Entity>("Id", fieldmask::mask_for_policy({"audit"}));
  registry.add<tests::Document>("Body", fieldmask::mask_for_policy({"audit"}));
  fieldmask::masker masker{{.registry = &registry}};

  fieldmask::mask_stats stats;
  auto masked = masker.mask(revision, "audit", &stats);
  ASSERT_EQ("", masked.Id);
  ASSERT_EQ("", masked.Body);
  ASSERT_EQ("admin", masked.CreatedBy);
  ASSERT_EQ(3, masked.Number);
  ASSERT_EQ(2, stats.erased);

  // the base itself
  tests::Entity entity;
  entity.Id = "entity-1";
  ASSERT_EQ("", masker.mask(entity, "audit").Id);
  ASSERT_EQ("rev-1", masker.mask(revision, "default").Id);
  ASSERT_EQ("rev-1", revision.Id);
}

TEST(MaskerTest, PolymorphicPointee) {
  static_assert(fieldmask::is_sliceable_v<tests::Shape>);
  static_assert(!fieldmask::is_sliceable_v<tests::Circle>);
  static_assert(!fieldmask::is_sliceable_v<tests::Secret>);

  auto circle = std::make_shared<tests::Circle>();
  circle->Owner = "owner";
  circle->Radius = 2.5;
  tests::Drawing drawing;
  drawing.Title = "drawing";
  drawing.Item = circle;

  auto masked = fieldmask::mask(drawing, "public");

  auto* copy = dynamic_cast<tests::Circle*>(masked.Item.get());
  ASSERT_NE(nullptr, copy);
  ASSERT_NE(circle.get(), copy);
  ASSERT_EQ(2.5, copy->Radius);
  ASSERT_EQ("", copy->Owner);
  ASSERT_EQ("drawing", masked.Title);
  ASSERT_EQ("owner", circle->Owner);

  // shared shapes stay shared
  std::vector<std::shared_ptr<tests::Shape>> shapes{circle, circle};
  auto copies = fieldmask::clone(shapes);
  ASSERT_EQ(copies[0], copies[1]);
  ASSERT_NE(nullptr, dynamic_cast<tests::Circle*>(copies[0].get()));
}

TEST(MaskerTest, NullAndScalarInputs) {
  ASSERT_EQ(nullptr, fieldmask::mask(std::shared_ptr<tests::Category>{}));
  ASSERT_FALSE(
    fieldmask::mask(std::optional<tests::Category>{}, "public").has_value());
  ASSERT_EQ(42, fieldmask::mask(42, "public"));
  ASSERT_EQ("text", fieldmask::mask(std::string{"text"}, "public"));
  ASSERT_EQ((std::vector<int>{1, 2}),
            fieldmask::mask(std::vector<int>{1, 2}, "public"));

  auto masked = fieldmask::mask(
    std::optional<tests::Category>{MakeCategory()}, "public");
  ASSERT_TRUE(masked.has_value());
  ASSERT_FALSE(masked->Name.has_value());
}

TEST(MaskerTest, CloneFailureLeavesInputUntouched) {
  tests::Connection connection;
  connection.Host = "localhost";
  connection.Socket = tests::Handle{5};

  ASSERT_THROW(fieldmask::mask(connection), fieldmask::clone_error);
  ASSERT_EQ("localhost", connection.Host);
  ASSERT_EQ(5, connection.Socket.fd());

  tests::Envelope envelope;
  envelope.Broken = true;
  ASSERT_THROW(fieldmask::mask(envelope), fieldmask::clone_error);
}

TEST(MaskerTest, DepthLimit) {
  tests::Category root = MakeCategory();
  root.Children.front().Children.emplace_back().Name = "A_1_1";

  fieldmask::masker shallow{{.max_depth = 2}};
  ASSERT_THROW(shallow.mask(root, "public"), fieldmask::depth_limit_error);

  fieldmask::masker deep{{.max_depth = 3}};
  ASSERT_NO_THROW(deep.mask(root, "public"));
}

TEST(MaskerTest, Logging) {
  tests::log_capture debug{fieldmask::log::Level::kDebug};
  tests::PublicApi public_api;

  fieldmask::mask(MakeCategory(), public_api, "public");

  ASSERT_TRUE(debug.contains("policy 'public'"));
  ASSERT_TRUE(debug.contains("context 'PublicApi'"));
  ASSERT_TRUE(debug.contains("erased 2 of 4 members"));
}
