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

#include "utils/log.hpp"

#include <array>
#include <utility>

namespace fieldmask::log {
namespace {

constexpr size_t kLevels = static_cast<size_t>(Level::kTrace) + 1;

std::array<Callback, kLevels> gCallbacks{};

}  // namespace

Callback SetCallback(Level level, Callback callback) noexcept {
  return std::exchange(gCallbacks[static_cast<size_t>(level)], callback);
}

bool Enabled(Level level) noexcept {
  return gCallbacks[static_cast<size_t>(level)] != nullptr;
}

void Message(Level level, SourceLocation&& location, std::string_view message) {
  auto callback = gCallbacks[static_cast<size_t>(level)];

  if (FIELDMASK_LIKELY(callback != nullptr)) {
    callback(std::move(location), message);
  }
}

}  // namespace fieldmask::log
