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
#include <string>
#include <string_view>
#include <type_traits>
#include <typeinfo>

#include <boost/core/demangle.hpp>

#include "shared.hpp"

namespace fieldmask {

class type_info {
 public:
  using type_id = type_info (*)() noexcept;

  // invalid id
  constexpr type_info() noexcept : type_info(nullptr, {}) {}

  constexpr explicit operator bool() const noexcept { return nullptr != id_; }

  constexpr bool operator==(const type_info& rhs) const noexcept {
    return id_ == rhs.id_;
  }

  constexpr bool operator<(const type_info& rhs) const noexcept {
    return id_ < rhs.id_;
  }

  constexpr std::string_view name() const noexcept { return name_; }
  constexpr type_id id() const noexcept { return id_; }

 private:
  template<typename T>
  friend struct type;

  constexpr type_info(type_id id, std::string_view name) noexcept
    : id_(id), name_(name) {}

  type_id id_;
  std::string_view name_;
};

template<typename T, typename = void>
struct has_type_name : std::false_type {};

template<typename T>
struct has_type_name<T, std::void_t<decltype(T::type_name())>>
  : std::true_type {};

template<typename T>
inline constexpr bool has_type_name_v = has_type_name<T>::value;

// Requires T::type_name()
template<typename T>
struct type {
  static constexpr type_info get() noexcept { return type_info{id(), name()}; }

  static constexpr std::string_view name() noexcept { return T::type_name(); }

  static constexpr type_info::type_id id() noexcept { return &get; }
};

// Human readable name of an arbitrary type, used for diagnostics only
template<typename T>
std::string type_name_of() {
  if constexpr (has_type_name_v<T>) {
    return std::string{type<T>::name()};
  } else {
    return boost::core::demangle(typeid(T).name());
  }
}

}  // namespace fieldmask

namespace std {

template<>
struct hash<::fieldmask::type_info> {
  size_t operator()(const ::fieldmask::type_info& key) const noexcept {
    return std::hash<decltype(key.id())>()(key.id());
  }
};

}  // namespace std
