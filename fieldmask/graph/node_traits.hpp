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

#include <array>
#include <chrono>
#include <cstddef>
#include <deque>
#include <list>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include <absl/container/flat_hash_map.h>
#include <absl/container/flat_hash_set.h>
#include <absl/container/node_hash_map.h>

#include "shared.hpp"
#include "utils/type_id.hpp"

namespace fieldmask {

// Shape of a node in the value graph
enum class node_kind : uint8_t {
  kScalar = 0,
  kSequence,
  kComposite,
};

template<typename T>
class member_table_builder;

template<typename>
inline constexpr bool dependent_false_v = false;

// Specialize to std::true_type to treat a user type as an opaque leaf
template<typename T>
struct opaque : std::false_type {};

////////////////////////////////////////////////////////////////////////////////
/// @brief composites describe their members either through the nested
///        'describe' function or through a specialization of this template
///        for types that cannot be modified
////////////////////////////////////////////////////////////////////////////////
template<typename T, typename = void>
struct composite_traits {};

template<typename T>
struct composite_traits<T, std::void_t<decltype(T::describe(
                             std::declval<member_table_builder<T>&>()))>> {
  static constexpr std::string_view type_name() noexcept {
    return T::type_name();
  }

  static void describe(member_table_builder<T>& members) {
    T::describe(members);
  }
};

template<typename T, typename = void>
struct is_composite : std::false_type {};

template<typename T>
struct is_composite<T, std::void_t<decltype(&composite_traits<T>::describe)>>
  : std::true_type {};

template<typename T>
inline constexpr bool is_composite_v = is_composite<T>::value;

// Identity of a composite type
template<typename T>
constexpr type_info composite_type() noexcept {
  static_assert(is_composite_v<T>);
  return type<composite_traits<T>>::get();
}

// -----------------------------------------------------------------------------
// --SECTION--                                                   nullable nodes
// -----------------------------------------------------------------------------

template<typename T>
struct nullable_traits {
  static constexpr bool kNullable = false;
};

template<typename T>
struct nullable_traits<std::optional<T>> {
  static constexpr bool kNullable = true;
  static constexpr bool kShared = false;
  using value_type = T;
};

template<typename T>
struct nullable_traits<std::unique_ptr<T>> {
  static constexpr bool kNullable = true;
  static constexpr bool kShared = false;
  using value_type = T;
};

template<typename T>
struct nullable_traits<std::shared_ptr<T>> {
  static constexpr bool kNullable = true;
  static constexpr bool kShared = true;
  using value_type = T;
};

template<typename T>
struct nullable_traits<std::weak_ptr<T>> {
  static constexpr bool kNullable = true;
  static constexpr bool kShared = true;
  using value_type = T;
};

template<typename T>
inline constexpr bool is_nullable_v = nullable_traits<T>::kNullable;

// -----------------------------------------------------------------------------
// --SECTION--                                                     scalar nodes
// -----------------------------------------------------------------------------

template<typename T>
struct is_scalar_node
  : std::bool_constant<std::is_arithmetic_v<T> || std::is_enum_v<T> ||
                       opaque<T>::value> {};

template<>
struct is_scalar_node<std::byte> : std::true_type {};

template<typename Char, typename Traits, typename Alloc>
struct is_scalar_node<std::basic_string<Char, Traits, Alloc>>
  : std::true_type {};

template<typename Char, typename Traits>
struct is_scalar_node<std::basic_string_view<Char, Traits>>
  : std::true_type {};

template<typename Rep, typename Period>
struct is_scalar_node<std::chrono::duration<Rep, Period>> : std::true_type {};

template<typename Clock, typename Duration>
struct is_scalar_node<std::chrono::time_point<Clock, Duration>>
  : std::true_type {};

// set-like containers are leaves as long as their keys are
template<typename T, typename Compare, typename Alloc>
struct is_scalar_node<std::set<T, Compare, Alloc>> : is_scalar_node<T> {};

template<typename T, typename Hash, typename Eq, typename Alloc>
struct is_scalar_node<std::unordered_set<T, Hash, Eq, Alloc>>
  : is_scalar_node<T> {};

template<typename T, typename Hash, typename Eq, typename Alloc>
struct is_scalar_node<absl::flat_hash_set<T, Hash, Eq, Alloc>>
  : is_scalar_node<T> {};

template<typename T>
inline constexpr bool is_scalar_node_v = is_scalar_node<T>::value;

// -----------------------------------------------------------------------------
// --SECTION--                                                   sequence nodes
// -----------------------------------------------------------------------------

template<typename T>
struct sequence_traits {
  static constexpr bool kSequence = false;
};

// ordered sequences with a push_back/emplace_back interface
template<typename Container>
struct linear_sequence_traits {
  static constexpr bool kSequence = true;
  using value_type = typename Container::value_type;

  template<typename Visitor>
  static void visit(Container& seq, Visitor&& visitor) {
    for (auto& element : seq) {
      visitor(element);
    }
  }

  template<typename Transform>
  static Container transform(const Container& seq, Transform&& transform) {
    Container out;
    for (auto& element : seq) {
      out.emplace_back(transform(element));
    }
    return out;
  }
};

template<typename T, typename Alloc>
struct sequence_traits<std::vector<T, Alloc>>
  : linear_sequence_traits<std::vector<T, Alloc>> {
  template<typename Transform>
  static std::vector<T, Alloc> transform(const std::vector<T, Alloc>& seq,
                                         Transform&& transform) {
    std::vector<T, Alloc> out;
    out.reserve(seq.size());
    for (auto& element : seq) {
      out.emplace_back(transform(element));
    }
    return out;
  }
};

template<typename T, typename Alloc>
struct sequence_traits<std::deque<T, Alloc>>
  : linear_sequence_traits<std::deque<T, Alloc>> {};

template<typename T, typename Alloc>
struct sequence_traits<std::list<T, Alloc>>
  : linear_sequence_traits<std::list<T, Alloc>> {};

template<typename T, size_t N>
struct sequence_traits<std::array<T, N>> {
  static constexpr bool kSequence = true;
  using value_type = T;

  template<typename Visitor>
  static void visit(std::array<T, N>& seq, Visitor&& visitor) {
    for (auto& element : seq) {
      visitor(element);
    }
  }

  template<typename Transform>
  static std::array<T, N> transform(const std::array<T, N>& seq,
                                    Transform&& transform) {
    std::array<T, N> out{};
    for (size_t i = 0; i < N; ++i) {
      out[i] = transform(seq[i]);
    }
    return out;
  }
};

// unordered sequences keyed by a scalar, only the mapped values are nodes
template<typename Container>
struct associative_sequence_traits {
  static constexpr bool kSequence = true;
  using key_type = typename Container::key_type;
  using value_type = typename Container::mapped_type;

  static_assert(is_scalar_node_v<key_type>,
                "associative sequences must be keyed by scalars");

  template<typename Visitor>
  static void visit(Container& seq, Visitor&& visitor) {
    for (auto& entry : seq) {
      visitor(entry.second);
    }
  }

  template<typename Transform>
  static Container transform(const Container& seq, Transform&& transform) {
    Container out;
    for (auto& entry : seq) {
      out.emplace(entry.first, transform(entry.second));
    }
    return out;
  }
};

template<typename K, typename V, typename Compare, typename Alloc>
struct sequence_traits<std::map<K, V, Compare, Alloc>>
  : associative_sequence_traits<std::map<K, V, Compare, Alloc>> {};

template<typename K, typename V, typename Hash, typename Eq, typename Alloc>
struct sequence_traits<std::unordered_map<K, V, Hash, Eq, Alloc>>
  : associative_sequence_traits<std::unordered_map<K, V, Hash, Eq, Alloc>> {};

template<typename K, typename V, typename Hash, typename Eq, typename Alloc>
struct sequence_traits<absl::flat_hash_map<K, V, Hash, Eq, Alloc>>
  : associative_sequence_traits<absl::flat_hash_map<K, V, Hash, Eq, Alloc>> {
};

template<typename K, typename V, typename Hash, typename Eq, typename Alloc>
struct sequence_traits<absl::node_hash_map<K, V, Hash, Eq, Alloc>>
  : associative_sequence_traits<absl::node_hash_map<K, V, Hash, Eq, Alloc>> {
};

template<typename T>
inline constexpr bool is_sequence_v = sequence_traits<T>::kSequence;

// -----------------------------------------------------------------------------
// --SECTION--                                                   classification
// -----------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// @brief shape of a node of type T, nullable wrappers are transparent
/// @note types that are neither scalars, sequences nor composites are
///       rejected at compile time
////////////////////////////////////////////////////////////////////////////////
template<typename T>
constexpr node_kind kind_of() noexcept {
  using node_type = std::remove_cv_t<T>;

  if constexpr (is_nullable_v<node_type>) {
    return kind_of<typename nullable_traits<node_type>::value_type>();
  } else if constexpr (is_scalar_node_v<node_type>) {
    return node_kind::kScalar;
  } else if constexpr (is_sequence_v<node_type>) {
    return node_kind::kSequence;
  } else if constexpr (is_composite_v<node_type>) {
    return node_kind::kComposite;
  } else {
    static_assert(dependent_false_v<node_type>,
                  "type is not a scalar, a sequence or a composite, "
                  "specialize fieldmask::opaque or "
                  "fieldmask::composite_traits for it");
    return node_kind::kScalar;
  }
}

// Whether a node of type T can contain members subject to masking
template<typename T>
constexpr bool is_maskable() noexcept {
  using node_type = std::remove_cv_t<T>;

  if constexpr (is_nullable_v<node_type>) {
    return is_maskable<typename nullable_traits<node_type>::value_type>();
  } else if constexpr (is_sequence_v<node_type> &&
                       !is_scalar_node_v<node_type>) {
    return is_maskable<typename sequence_traits<node_type>::value_type>();
  } else {
    return kind_of<node_type>() == node_kind::kComposite;
  }
}

std::string_view to_string(node_kind kind) noexcept;

}  // namespace fieldmask
