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

#include "shared.hpp"
#include "utils/type_id.hpp"

namespace fieldmask {

////////////////////////////////////////////////////////////////////////////////
/// @class calling_context
/// @brief opaque identity of the party requesting the masked data, e.g. the
///        endpoint serving the current request. The engine only forwards it
///        to rule predicates.
////////////////////////////////////////////////////////////////////////////////
class calling_context {
 public:
  virtual ~calling_context() = default;

  virtual type_info type() const noexcept = 0;
};

// Convenient base class for contexts identified by their own type
template<typename Type>
class calling_context_base : public calling_context {
 public:
  using context_type = Type;

  type_info type() const noexcept final { return fieldmask::type<Type>::get(); }
};

}  // namespace fieldmask
