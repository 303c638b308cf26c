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
#include <type_traits>
#include <typeinfo>
#include <utility>

#include <absl/container/flat_hash_map.h>
#include <absl/strings/str_cat.h>

#include "error/error.hpp"
#include "graph/member_table.hpp"
#include "graph/node_traits.hpp"
#include "shared.hpp"
#include "utils/assert.hpp"
#include "utils/noncopyable.hpp"
#include "utils/type_id.hpp"

namespace fieldmask {

////////////////////////////////////////////////////////////////////////////////
/// @class clone_context
/// @brief state of a single deep copy, maps shared nodes of the source graph
///        to their copies so that sharing and cycles are reproduced
////////////////////////////////////////////////////////////////////////////////
class clone_context : private util::noncopyable {
 public:
  template<typename T>
  std::shared_ptr<T> find(const T* src) const {
    auto it = shared_.find(key(src));
    return it == shared_.end() ? nullptr
                               : std::static_pointer_cast<T>(it->second);
  }

  template<typename T>
  void emplace(const T* src, std::shared_ptr<T> dst) {
    [[maybe_unused]] const bool inserted =
      shared_.emplace(key(src), std::move(dst)).second;
    FIELDMASK_ASSERT(inserted);
  }

  // number of distinct shared nodes copied so far
  size_t shared_count() const noexcept { return shared_.size(); }

 private:
  using key_type = std::pair<const void*, const std::type_info*>;

  template<typename T>
  static key_type key(const T* src) noexcept {
    return {static_cast<const void*>(src), &typeid(T)};
  }

  // copies are kept alive until the end of the clone so that weak
  // references to them remain valid while the graph is being built
  absl::flat_hash_map<key_type, std::shared_ptr<void>> shared_;
};

////////////////////////////////////////////////////////////////////////////////
/// @brief deep copy of a node, specialize for types requiring a custom copy
/// @note pointers to polymorphic non-final types are rejected since copying
///       them through their static type would slice the pointee, such
///       pointers require a specialization that copies the dynamic type
////////////////////////////////////////////////////////////////////////////////
template<typename T, typename = void>
struct clone_traits;

// true if copying a 'T' through a pointer may drop a derived part
template<typename T>
inline constexpr bool is_sliceable_v =
  std::is_polymorphic_v<T> && !std::is_final_v<T>;

template<typename T>
T clone_node(const T& node, clone_context& ctx) {
  return clone_traits<std::remove_cv_t<T>>::clone(node, ctx);
}

namespace detail {

template<typename T>
[[noreturn]] void throw_not_copyable(std::string_view reason) {
  throw clone_error{absl::StrCat("cannot clone '", type_name_of<T>(), "': ",
                                 reason)};
}

// Initial state of a composite copy, members are replaced afterwards
template<typename Composite>
Composite make_composite(const Composite& src) {
  if constexpr (std::is_copy_constructible_v<Composite>) {
    return Composite(src);
  } else if constexpr (std::is_default_constructible_v<Composite>) {
    return Composite{};
  } else {
    throw_not_copyable<Composite>(
      "composite is neither copy nor default constructible");
  }
}

template<typename Composite>
void clone_members(const Composite& src, Composite& dst, clone_context& ctx) {
  auto& table = member_table<Composite>::instance();

  for (auto& member : table.properties()) {
    member->clone(src, dst, ctx);
  }

  for (auto& member : table.fields()) {
    member->clone(src, dst, ctx);
  }
}

template<typename T>
std::shared_ptr<T> clone_shared(const std::shared_ptr<T>& node,
                                clone_context& ctx) {
  static_assert(!is_sliceable_v<T>,
                "shared pointers to polymorphic types require a clone_traits "
                "specialization");

  if (!node) {
    return nullptr;
  }

  if (auto copy = ctx.find(node.get()); copy) {
    return copy;
  }

  if constexpr (is_composite_v<T>) {
    // register before descending so that cycles resolve to this copy
    auto copy = std::make_shared<T>(make_composite(*node));
    ctx.emplace(node.get(), copy);
    clone_members(*node, *copy, ctx);
    return copy;
  } else {
    auto copy = std::make_shared<T>(clone_node(*node, ctx));
    ctx.emplace(node.get(), copy);
    return copy;
  }
}

}  // namespace detail

template<typename T, typename>
struct clone_traits {
  static T clone(const T& node, clone_context& ctx) {
    if constexpr (is_nullable_v<T>) {
      return clone_nullable(node, ctx);
    } else if constexpr (kind_of<T>() == node_kind::kScalar) {
      if constexpr (std::is_copy_constructible_v<T>) {
        return node;
      } else {
        detail::throw_not_copyable<T>("opaque value is not copyable");
      }
    } else if constexpr (kind_of<T>() == node_kind::kSequence) {
      if constexpr (!is_maskable<T>() && std::is_copy_constructible_v<T>) {
        // nothing to isolate below scalars
        return node;
      } else {
        return sequence_traits<T>::transform(
          node, [&ctx](const auto& element) { return clone_node(element, ctx); });
      }
    } else {
      auto copy = detail::make_composite(node);
      detail::clone_members(node, copy, ctx);
      return copy;
    }
  }

 private:
  static T clone_nullable(const T& node, clone_context& ctx) {
    using value_type = typename nullable_traits<T>::value_type;

    if constexpr (std::is_same_v<T, std::optional<value_type>>) {
      if (!node) {
        return std::nullopt;
      }
      return T{std::in_place, clone_node(*node, ctx)};
    } else if constexpr (std::is_same_v<T, std::unique_ptr<value_type>>) {
      static_assert(!is_sliceable_v<value_type>,
                    "unique pointers to polymorphic types require a "
                    "clone_traits specialization");

      if (!node) {
        return nullptr;
      }
      return std::make_unique<value_type>(clone_node(*node, ctx));
    } else if constexpr (std::is_same_v<T, std::shared_ptr<value_type>>) {
      return detail::clone_shared(node, ctx);
    } else {
      // weak reference, the copy is owned by whoever owns it in the graph
      return T{clone_node(node.lock(), ctx)};
    }
  }
};

////////////////////////////////////////////////////////////////////////////////
/// @brief clone boundary: a structurally equal copy of 'data' sharing no
///        node with it
/// @throws clone_error if any node cannot be copied
////////////////////////////////////////////////////////////////////////////////
template<typename T>
T clone(const T& data) {
  clone_context ctx;
  return clone_node(data, ctx);
}

}  // namespace fieldmask
