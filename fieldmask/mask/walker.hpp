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

#include <memory>
#include <optional>
#include <string_view>
#include <type_traits>
#include <typeinfo>
#include <utility>

#include <absl/container/flat_hash_set.h>

#include "graph/member_table.hpp"
#include "graph/node_traits.hpp"
#include "mask/context.hpp"
#include "mask/rule.hpp"
#include "mask/rule_registry.hpp"
#include "shared.hpp"
#include "utils/noncopyable.hpp"

namespace fieldmask {

// Diagnostics of a single masking pass
struct mask_stats {
  // composites whose members were evaluated
  size_t composites{0};
  // members evaluated against rules
  size_t members{0};
  // members set to their empty representation
  size_t erased{0};
  // matched members left untouched because they are read-only
  size_t readonly_skipped{0};
  // shared nodes skipped because they are already being masked on the
  // current path
  size_t cycles_skipped{0};
};

////////////////////////////////////////////////////////////////////////////////
/// @class walk_state
/// @brief state of a single masking pass over an already cloned graph
////////////////////////////////////////////////////////////////////////////////
class walk_state : private util::noncopyable {
 public:
  ////////////////////////////////////////////////////////////////////////////
  /// @brief tracks the composite whose members are being evaluated
  ////////////////////////////////////////////////////////////////////////////
  class composite_scope : private util::nonmovable {
   public:
    composite_scope(walk_state& state, type_info owner);
    ~composite_scope();

   private:
    walk_state& state_;
    type_info owner_;
    type_info via_;
  };

  ////////////////////////////////////////////////////////////////////////////
  /// @brief marks a shared node as being masked on the current path, a node
  ///        reached through several parents is masked once per path
  ////////////////////////////////////////////////////////////////////////////
  class shared_scope : private util::nonmovable {
   public:
    template<typename T>
    shared_scope(walk_state& state, const T* node)
      : state_(state), key_(static_cast<const void*>(node), &typeid(T)) {
      entered_ = state_.path_.emplace(key_).second;
      if (!entered_) {
        ++state_.stats_.cycles_skipped;
      }
    }

    ~shared_scope() {
      if (entered_) {
        state_.path_.erase(key_);
      }
    }

    // false if the node is already on the current path
    bool entered() const noexcept { return entered_; }

   private:
    walk_state& state_;
    std::pair<const void*, const std::type_info*> key_;
    bool entered_;
  };

  // 'policy' is the effective policy name, 'max_depth' == 0 means unbounded
  walk_state(const calling_context* context, std::string_view policy,
             const rule_registry* registry, size_t max_depth) noexcept;

  // true if any rule attached to 'member' of the current owner matches
  bool match(const member_info& member) const;

  void on_member() noexcept { ++stats_.members; }
  void on_erased(const member_info& member);
  void on_readonly(const member_info& member);

  const calling_context* context() const noexcept { return context_; }
  std::string_view policy() const noexcept { return policy_; }
  type_info owner() const noexcept { return owner_; }
  type_info via() const noexcept { return via_; }
  size_t depth() const noexcept { return depth_; }
  const mask_stats& stats() const noexcept { return stats_; }

 private:
  using path_t =
    absl::flat_hash_set<std::pair<const void*, const std::type_info*>>;

  // shared nodes on the path from the root to the current node
  path_t path_;
  mask_stats stats_;
  const calling_context* context_;
  const rule_registry* registry_;
  std::string_view policy_;
  type_info owner_;
  type_info via_;
  size_t max_depth_;
  size_t depth_{0};
};

namespace detail {

template<typename Composite>
void walk_member(Composite& node, const member<Composite>& member,
                 walk_state& state) {
  state.on_member();

  // erase is terminal, a matched member is never descended into
  if (state.match(member)) {
    if (member.writable()) {
      member.erase(node);
      state.on_erased(member);
    } else {
      state.on_readonly(member);
    }
    return;
  }

  // read-only properties are not descended since the result cannot be
  // written back, their backing fields are reached directly
  if (member.value_kind() == node_kind::kScalar || !member.writable()) {
    return;
  }

  member.descend(node, state);
}

template<typename Composite>
void walk_composite(Composite& node, walk_state& state) {
  auto& table = member_table<Composite>::instance();
  walk_state::composite_scope scope{state, table.type()};

  for (auto& member : table.properties()) {
    walk_member(node, *member, state);
  }

  for (auto& member : table.fields()) {
    walk_member(node, *member, state);
  }
}

}  // namespace detail

////////////////////////////////////////////////////////////////////////////////
/// @brief masks 'node' in place, 'node' must belong to a cloned graph
////////////////////////////////////////////////////////////////////////////////
template<typename T>
void walk_node(T& node, walk_state& state) {
  using node_type = std::remove_cv_t<T>;

  if constexpr (!is_maskable<node_type>()) {
    // scalars and sequences of scalars are never descended into
  } else if constexpr (is_nullable_v<node_type>) {
    using value_type = typename nullable_traits<node_type>::value_type;

    if constexpr (std::is_same_v<node_type, std::weak_ptr<value_type>>) {
      if (auto target = node.lock(); target) {
        walk_state::shared_scope scope{state, target.get()};
        if (scope.entered()) {
          walk_node(*target, state);
        }
      }
    } else if constexpr (nullable_traits<node_type>::kShared) {
      if (node) {
        walk_state::shared_scope scope{state, node.get()};
        if (scope.entered()) {
          walk_node(*node, state);
        }
      }
    } else if (node) {
      walk_node(*node, state);
    }
  } else if constexpr (kind_of<node_type>() == node_kind::kSequence) {
    sequence_traits<node_type>::visit(
      node, [&state](auto& element) { walk_node(element, state); });
  } else {
    detail::walk_composite(node, state);
  }
}

}  // namespace fieldmask
