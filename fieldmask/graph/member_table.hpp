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
#include <span>
#include <type_traits>
#include <string_view>
#include <utility>
#include <vector>

#include <absl/strings/str_cat.h>

#include "error/error.hpp"
#include "graph/member.hpp"
#include "graph/node_traits.hpp"
#include "shared.hpp"
#include "utils/noncopyable.hpp"

namespace fieldmask {

////////////////////////////////////////////////////////////////////////////////
/// @class member_table_base
/// @brief type independent view of the members of a composite
////////////////////////////////////////////////////////////////////////////////
class member_table_base : private util::noncopyable {
 public:
  using visitor_f = std::function<bool(const member_info&)>;

  member_table_base() = default;
  member_table_base(member_table_base&&) = default;
  virtual ~member_table_base() = default;

  virtual type_info type() const noexcept = 0;

  // properties take precedence over fields with the same name
  virtual const member_info* find(std::string_view name) const noexcept = 0;

  // visit properties then fields, terminate early if visitor returns false
  virtual bool visit(const visitor_f& visitor) const = 0;

  virtual size_t size() const noexcept = 0;
};

////////////////////////////////////////////////////////////////////////////////
/// @class member_table
/// @brief members of a composite of type 'Owner', built once on first use
///        from composite_traits<Owner>::describe(...)
////////////////////////////////////////////////////////////////////////////////
template<typename Owner>
class member_table final : public member_table_base {
 public:
  using member_type = member<Owner>;
  using members_t = std::vector<typename member_type::ptr>;

  static const member_table& instance() {
    static const member_table kInstance{build()};
    return kInstance;
  }

  type_info type() const noexcept override { return composite_type<Owner>(); }

  std::span<const typename member_type::ptr> properties() const noexcept {
    return properties_;
  }

  std::span<const typename member_type::ptr> fields() const noexcept {
    return fields_;
  }

  const member_info* find(std::string_view name) const noexcept override {
    if (auto* member = find(properties_, name); member) {
      return member;
    }
    return find(fields_, name);
  }

  bool visit(const visitor_f& visitor) const override {
    for (auto& member : properties_) {
      if (!visitor(*member)) {
        return false;
      }
    }
    for (auto& member : fields_) {
      if (!visitor(*member)) {
        return false;
      }
    }
    return true;
  }

  size_t size() const noexcept override {
    return properties_.size() + fields_.size();
  }

  member_table(member_table&&) = default;

 private:
  friend class member_table_builder<Owner>;

  member_table() = default;

  static member_table build();

  static const member_type* find(const members_t& members,
                                 std::string_view name) noexcept {
    for (auto& member : members) {
      if (member->name() == name) {
        return member.get();
      }
    }
    return nullptr;
  }

  members_t properties_;
  members_t fields_;
};

////////////////////////////////////////////////////////////////////////////////
/// @class member_declaration
/// @brief handle to a freshly declared member, used to attach rules
////////////////////////////////////////////////////////////////////////////////
class member_declaration {
 public:
  explicit member_declaration(member_info& member) noexcept
    : member_(&member) {}

  member_declaration& mask(mask_rule::ptr rule) {
    member_->add_rule(std::move(rule));
    return *this;
  }

  const member_info& info() const noexcept { return *member_; }

 private:
  member_info* member_;
};

template<typename Owner>
class member_table_builder : private util::noncopyable {
 public:
  // 'Class' is either 'Owner' or one of its bases
  template<typename Value, typename Class>
  member_declaration field(std::string_view name, Value Class::*ptr) {
    static_assert(std::is_base_of_v<Class, Owner>);
    return add(table_.fields_, std::make_unique<field_member<Owner, Value>>(
                                 name, static_cast<Value Owner::*>(ptr)));
  }

  // read-only property
  template<typename Getter>
  member_declaration property(std::string_view name, Getter getter) {
    using member_type = property_member<Owner, Getter, no_setter>;
    return add(table_.properties_,
               std::make_unique<member_type>(name, std::move(getter),
                                             no_setter{}));
  }

  template<typename Getter, typename Setter>
  member_declaration property(std::string_view name, Getter getter,
                              Setter setter) {
    using member_type = property_member<Owner, Getter, Setter>;
    return add(table_.properties_,
               std::make_unique<member_type>(name, std::move(getter),
                                             std::move(setter)));
  }

  // import all members declared by the composite base 'Base'
  template<typename Base>
  void inherit() {
    static_assert(std::is_base_of_v<Base, Owner> && is_composite_v<Base>);
    auto& base = member_table<Base>::instance();
    for (auto& member : base.properties()) {
      add(table_.properties_,
          std::make_unique<inherited_member<Owner, Base>>(*member));
    }
    for (auto& member : base.fields()) {
      add(table_.fields_,
          std::make_unique<inherited_member<Owner, Base>>(*member));
    }
  }

 private:
  friend class member_table<Owner>;

  using members_t = typename member_table<Owner>::members_t;

  member_declaration add(members_t& members,
                         typename member<Owner>::ptr&& member) {
    if (member_table<Owner>::find(members, member->name())) {
      throw illegal_argument{absl::StrCat(
        "duplicate ", to_string(member->kind()), " '", member->name(),
        "' while describing '", composite_type<Owner>().name(), "'")};
    }

    auto& added = *members.emplace_back(std::move(member));
    return member_declaration{added};
  }

  member_table<Owner> table_;
};

template<typename Owner>
member_table<Owner> member_table<Owner>::build() {
  member_table_builder<Owner> builder;
  composite_traits<Owner>::describe(builder);
  return std::move(builder.table_);
}

}  // namespace fieldmask

// Member accessors instantiate the traversal templates wherever members are
// described
#include "mask/clone.hpp"
#include "mask/walker.hpp"
