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

#include "mask/masker.hpp"

#include <absl/strings/str_cat.h>

#include "utils/log.hpp"

namespace fieldmask {

void masker::log_begin(const calling_context* context,
                       std::string_view policy) {
  FIELDMASK_LOG_DEBUG(absl::StrCat(
    "masking under policy '", policy, "' for ",
    context ? absl::StrCat("context '", context->type().name(), "'")
            : std::string{"no context"}));
}

void masker::log_end(const walk_state& state) {
  auto& stats = state.stats();
  FIELDMASK_LOG_DEBUG(absl::StrCat(
    "masked ", stats.composites, " composites, erased ", stats.erased, " of ",
    stats.members, " members, skipped ", stats.readonly_skipped,
    " read-only and ", stats.cycles_skipped, " cyclic"));
}

}  // namespace fieldmask
