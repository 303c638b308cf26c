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

#include "mask/clone.hpp"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "error/error.hpp"
#include "models.hpp"
#include "tests_shared.hpp"

namespace {

tests::Category MakeTree() {
  tests::Category root;
  root.Name = "A";
  auto& child = root.Children.emplace_back();
  child.Name = "A_1";
  child.Children.emplace_back().Name = "A_1_1";
  root.Children.emplace_back().Name = "A_2";
  return root;
}

}  // namespace

TEST(CloneTest, Scalars) {
  ASSERT_EQ(42, fieldmask::clone(42));
  ASSERT_EQ("value", fieldmask::clone(std::string{"value"}));
  ASSERT_EQ((std::vector<int>{1, 2, 3}),
            fieldmask::clone(std::vector<int>{1, 2, 3}));
  ASSERT_FALSE(fieldmask::clone(std::optional<int>{}).has_value());
}

TEST(CloneTest, Composite) {
  const auto tree = MakeTree();
  auto copy = fieldmask::clone(tree);
  ASSERT_EQ(tree, copy);
  ASSERT_NE(&tree.Children.front(), &copy.Children.front());

  // modifying the copy leaves the source untouched
  copy.Children.front().Children.front().Name = "changed";
  ASSERT_EQ("A_1_1", tree.Children.front().Children.front().Name);
}

TEST(CloneTest, Properties) {
  const tests::Profile profile{42, "user@example.com", "555-0100"};
  auto copy = fieldmask::clone(profile);
  ASSERT_EQ(profile, copy);
}

TEST(CloneTest, InheritedMembers) {
  tests::Document doc;
  doc.Id = "doc-1";
  doc.CreatedBy = "admin";
  doc.Body = "text";
  doc.Tags["first"].Name = "tag";

  auto copy = fieldmask::clone(doc);
  ASSERT_EQ(doc, copy);
}

TEST(CloneTest, UniquePointer) {
  auto src = std::make_unique<tests::Secret>();
  src->Code = "1234";

  auto copy = fieldmask::clone(src);
  ASSERT_NE(nullptr, copy);
  ASSERT_NE(src.get(), copy.get());
  ASSERT_EQ(*src, *copy);

  ASSERT_EQ(nullptr, fieldmask::clone(std::unique_ptr<tests::Secret>{}));
}

TEST(CloneTest, SharedNodesStayShared) {
  auto shared = std::make_shared<tests::Category>();
  shared->Name = "shared";
  std::vector<std::shared_ptr<tests::Category>> src{shared, shared, nullptr};

  auto copy = fieldmask::clone(src);
  ASSERT_EQ(3, copy.size());
  ASSERT_NE(shared, copy[0]);
  ASSERT_EQ(copy[0], copy[1]);
  ASSERT_EQ(nullptr, copy[2]);
  ASSERT_EQ(*shared, *copy[0]);
}

TEST(CloneTest, Cycle) {
  auto a = tests::make_node("a", "token-a");
  auto b = tests::make_node("b", "token-b");
  a->Next.emplace_back(b);
  b->Next.emplace_back(a);

  auto copy = fieldmask::clone(a);
  ASSERT_NE(a, copy);
  ASSERT_EQ("a", copy->Name);
  ASSERT_EQ(1, copy->Next.size());
  auto copy_b = copy->Next.front();
  ASSERT_NE(b, copy_b);
  ASSERT_EQ("b", copy_b->Name);
  ASSERT_EQ(copy, copy_b->Next.front());

  // break reference cycles
  a->Next.clear();
  b->Next.clear();
  copy_b->Next.clear();
}

TEST(CloneTest, WeakReferences) {
  auto root = tests::make_node("root", "");
  auto child = tests::make_node("child", "");
  child->Parent = root;
  root->Next.emplace_back(child);

  auto copy = fieldmask::clone(root);
  auto copy_child = copy->Next.front();
  ASSERT_EQ(copy, copy_child->Parent.lock());
  ASSERT_EQ(root, child->Parent.lock());

  // target owned by nobody else in the graph
  auto orphan = tests::make_node("orphan", "");
  orphan->Parent = tests::make_node("parent", "");
  ASSERT_TRUE(orphan->Parent.expired());

  auto parent = tests::make_node("parent", "");
  orphan->Parent = parent;
  auto orphan_copy = fieldmask::clone(orphan);
  ASSERT_TRUE(orphan_copy->Parent.expired());
  ASSERT_FALSE(orphan->Parent.expired());
}

TEST(CloneTest, NonCopyableLeaf) {
  tests::Connection connection;
  connection.Host = "localhost";
  connection.Socket = tests::Handle{3};

  ASSERT_THROW(fieldmask::clone(connection), fieldmask::clone_error);
  ASSERT_EQ("localhost", connection.Host);
  ASSERT_EQ(3, connection.Socket.fd());
}

TEST(CloneTest, FailingAccessor) {
  tests::Envelope envelope;
  envelope.Content.Data = "payload";
  ASSERT_NO_THROW(fieldmask::clone(envelope));

  envelope.Broken = true;
  try {
    fieldmask::clone(envelope);
    FAIL() << "clone_error expected";
  } catch (const fieldmask::clone_error& e) {
    ASSERT_EQ(fieldmask::ErrorCode::clone_error, e.code());
    ASSERT_NE(std::string_view::npos,
              std::string_view{e.what()}.find("Content"));
  }
}

TEST(CloneTest, ExternalTraits) {
  const std::vector<tests::Point> points{{1, 2}, {3, 4}};
  ASSERT_EQ(points, fieldmask::clone(points));
}
