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

#include <string_view>

#include "shared.hpp"
#include "utils/source_location.hpp"

namespace fieldmask::assert {

// Receives the text of the violated condition
using Callback = void (*)(SourceLocation&& location,
                          std::string_view condition);

// not thread-safe, returns the previous callback
Callback SetCallback(Callback callback) noexcept;

// Reports a violated invariant to the installed callback, or as a fatal log
// message if there is none
void Fail(SourceLocation&& location, std::string_view condition);

}  // namespace fieldmask::assert

// Invariant checks are compiled in debug builds only, the condition must
// have no side effects
#ifdef FIELDMASK_DEBUG
#define FIELDMASK_ASSERT(condition)                                       \
  (FIELDMASK_LIKELY(condition)                                            \
     ? static_cast<void>(0)                                               \
     : ::fieldmask::assert::Fail(FIELDMASK_SOURCE_LOCATION, #condition))
#else
#define FIELDMASK_ASSERT(condition) static_cast<void>(sizeof(condition))
#endif
