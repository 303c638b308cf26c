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

#include "utils/assert.hpp"

#include <utility>

#include <absl/strings/str_cat.h>

#include "utils/log.hpp"

namespace fieldmask::assert {
namespace {

Callback gCallback = nullptr;

}  // namespace

Callback SetCallback(Callback callback) noexcept {
  return std::exchange(gCallback, callback);
}

void Fail(SourceLocation&& location, std::string_view condition) {
  if (gCallback) {
    gCallback(std::move(location), condition);
    return;
  }

  if (log::Enabled(log::Level::kFatal)) {
    log::Message(log::Level::kFatal, std::move(location),
                 absl::StrCat("invariant violated: ", condition));
  }
}

}  // namespace fieldmask::assert
