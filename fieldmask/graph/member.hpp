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
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include <absl/strings/str_cat.h>

#include "error/error.hpp"
#include "graph/node_traits.hpp"
#include "mask/rule.hpp"
#include "shared.hpp"

namespace fieldmask {

class walk_state;
class clone_context;

// Defined in mask/walker.hpp and mask/clone.hpp
template<typename T>
void walk_node(T& node, walk_state& state);
template<typename T>
T clone_node(const T& node, clone_context& ctx);

enum class member_kind : uint8_t {
  kProperty = 0,
  kField,
};

std::string_view to_string(member_kind kind) noexcept;

////////////////////////////////////////////////////////////////////////////////
/// @class member_info
/// @brief type independent description of a composite member
////////////////////////////////////////////////////////////////////////////////
class member_info {
 public:
  using rules_t = std::vector<mask_rule::ptr>;
  using bases_t = std::vector<type_info>;

  member_info(std::string_view name, member_kind kind, bool writable,
              node_kind value_kind)
    : name_(name), kind_(kind), value_kind_(value_kind), writable_(writable) {}

  virtual ~member_info() = default;

  std::string_view name() const noexcept { return name_; }
  member_kind kind() const noexcept { return kind_; }
  // fields are always writable, properties only if they have a setter
  bool writable() const noexcept { return writable_; }
  node_kind value_kind() const noexcept { return value_kind_; }
  // rules attached to the member at declaration
  const rules_t& rules() const noexcept { return rules_; }
  // composite bases the member is inherited through, nearest first, empty
  // if the member is declared by its owner
  const bases_t& bases() const noexcept { return bases_; }

  void add_rule(mask_rule::ptr rule) { rules_.emplace_back(std::move(rule)); }

 protected:
  void add_base(type_info base) { bases_.emplace_back(base); }

 private:
  std::string name_;
  rules_t rules_;
  bases_t bases_;
  member_kind kind_;
  node_kind value_kind_;
  bool writable_;
};

////////////////////////////////////////////////////////////////////////////////
/// @class member
/// @brief accessor for a member of a composite of type 'Owner'
////////////////////////////////////////////////////////////////////////////////
template<typename Owner>
class member : public member_info {
 public:
  using ptr = std::unique_ptr<member<Owner>>;
  using member_info::member_info;

  // set the member to its empty representation
  virtual void erase(Owner& owner) const = 0;

  // mask the member value in place, writing it back if necessary
  virtual void descend(Owner& owner, walk_state& state) const = 0;

  // replace the member of 'dst' by a deep copy of the one in 'src'
  virtual void clone(const Owner& src, Owner& dst,
                     clone_context& ctx) const = 0;
};

template<typename Owner, typename Value>
class field_member final : public member<Owner> {
 public:
  using value_type = Value;
  using pointer_type = Value Owner::*;

  static_assert(std::is_default_constructible_v<Value> &&
                  std::is_move_assignable_v<Value>,
                "fields must be default constructible and move assignable");

  field_member(std::string_view name, pointer_type ptr)
    : member<Owner>(name, member_kind::kField, true, kind_of<Value>()),
      ptr_(ptr) {}

  void erase(Owner& owner) const override { owner.*ptr_ = Value{}; }

  void descend(Owner& owner, walk_state& state) const override {
    if constexpr (is_maskable<Value>()) {
      walk_node(owner.*ptr_, state);
    }
  }

  void clone(const Owner& src, Owner& dst, clone_context& ctx) const override {
    dst.*ptr_ = clone_node(src.*ptr_, ctx);
  }

 private:
  pointer_type ptr_;
};

template<typename Owner, typename Getter>
using property_value_t =
  std::remove_cvref_t<std::invoke_result_t<const Getter&, const Owner&>>;

// Marker for properties without a setter
struct no_setter {};

template<typename Owner, typename Getter, typename Setter>
class property_member final : public member<Owner> {
 public:
  using value_type = property_value_t<Owner, Getter>;

  static constexpr bool kWritable = !std::is_same_v<Setter, no_setter>;

  property_member(std::string_view name, Getter getter, Setter setter)
    : member<Owner>(name, member_kind::kProperty, kWritable,
                    kind_of<value_type>()),
      getter_(std::move(getter)),
      setter_(std::move(setter)) {}

  void erase(Owner& owner) const override {
    if constexpr (kWritable) {
      write(owner, value_type{});
    }
  }

  void descend(Owner& owner, walk_state& state) const override {
    if constexpr (kWritable && is_maskable<value_type>()) {
      auto value = read(owner);
      walk_node(value, state);
      write(owner, std::move(value));
    }
  }

  void clone(const Owner& src, Owner& dst, clone_context& ctx) const override {
    if constexpr (kWritable) {
      try {
        write(dst, clone_node(read(src), ctx));
      } catch (const introspection_error& e) {
        throw clone_error{e.what()};
      }
    }
  }

 private:
  value_type read(const Owner& owner) const {
    try {
      return std::invoke(getter_, owner);
    } catch (const error_base&) {
      throw;
    } catch (const std::exception& e) {
      throw introspection_error{
        absl::StrCat("failed to read property '", this->name(), "' of '",
                     composite_type<Owner>().name(), "': ", e.what())};
    }
  }

  void write(Owner& owner, value_type&& value) const {
    try {
      std::invoke(setter_, owner, std::move(value));
    } catch (const error_base&) {
      throw;
    } catch (const std::exception& e) {
      throw introspection_error{
        absl::StrCat("failed to write property '", this->name(), "' of '",
                     composite_type<Owner>().name(), "': ", e.what())};
    }
  }

  Getter getter_;
  Setter setter_;
};

// Member declared by the composite base 'Base' of 'Owner'
template<typename Owner, typename Base>
class inherited_member final : public member<Owner> {
 public:
  explicit inherited_member(const member<Base>& base)
    : member<Owner>(base.name(), base.kind(), base.writable(),
                    base.value_kind()),
      base_(&base) {
    for (auto& rule : base.rules()) {
      this->add_rule(rule);
    }
    this->add_base(composite_type<Base>());
    for (auto type : base.bases()) {
      this->add_base(type);
    }
  }

  void erase(Owner& owner) const override {
    base_->erase(static_cast<Base&>(owner));
  }

  void descend(Owner& owner, walk_state& state) const override {
    base_->descend(static_cast<Base&>(owner), state);
  }

  void clone(const Owner& src, Owner& dst, clone_context& ctx) const override {
    base_->clone(static_cast<const Base&>(src), static_cast<Base&>(dst), ctx);
  }

 private:
  const member<Base>* base_;
};

}  // namespace fieldmask
