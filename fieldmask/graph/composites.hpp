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
#include <string_view>

#include "graph/member_table.hpp"
#include "shared.hpp"

namespace fieldmask {

using member_table_f = const member_table_base& (*)();

class composite_registrar {
 public:
  composite_registrar(const type_info& type, member_table_f table,
                      const char* source = nullptr);

  explicit operator bool() const noexcept { return registered_; }

 private:
  bool registered_;
};

namespace composites {

////////////////////////////////////////////////////////////////////////////////
/// @brief checks whether a composite with the specified name is registered
////////////////////////////////////////////////////////////////////////////////
bool exists(std::string_view name);

////////////////////////////////////////////////////////////////////////////////
/// @brief member table of a composite by name, or nullptr if not found
/// @note builds the member table on first access
////////////////////////////////////////////////////////////////////////////////
const member_table_base* get(std::string_view name);

////////////////////////////////////////////////////////////////////////////////
/// @brief visit all registered composites, terminate early if visitor
///        returns false
////////////////////////////////////////////////////////////////////////////////
bool visit(const std::function<bool(std::string_view)>& visitor);

}  // namespace composites

template<typename Composite>
const member_table_base& member_table_of() {
  return member_table<Composite>::instance();
}

}  // namespace fieldmask

#define FIELDMASK_REGISTER_COMPOSITE_IMPL(composite_name, line, source)    \
  static ::fieldmask::composite_registrar composite_registrar##_##line(    \
    ::fieldmask::composite_type<composite_name>(),                         \
    &::fieldmask::member_table_of<composite_name>, source)
#define FIELDMASK_REGISTER_COMPOSITE_EXPANDER_IMPL(composite_name, file, line) \
  FIELDMASK_REGISTER_COMPOSITE_IMPL(composite_name, line,                      \
                                    file ":" FIELDMASK_TOSTRING(line))
#define FIELDMASK_REGISTER_COMPOSITE(composite_name)                   \
  FIELDMASK_REGISTER_COMPOSITE_EXPANDER_IMPL(composite_name, __FILE__, \
                                             __LINE__)
