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

namespace fieldmask::log {

// use a prefix that does not clash with any predefined macros (e.g. win32
// 'ERROR')
enum class Level : uint8_t {
  kFatal = 0,
  kError,
  kWarn,
  kInfo,
  kDebug,
  kTrace,
};

using Callback = void (*)(SourceLocation&& location, std::string_view message);

// not thread-safe, expected to be called once during startup
Callback SetCallback(Level level, Callback callback) noexcept;

bool Enabled(Level level) noexcept;

void Message(Level level, SourceLocation&& location, std::string_view message);

}  // namespace fieldmask::log

#define FIELDMASK_LOG_IMPL(level, message)                                \
  do {                                                                    \
    if (::fieldmask::log::Enabled(level)) {                               \
      ::fieldmask::log::Message(level, FIELDMASK_SOURCE_LOCATION, message); \
    }                                                                     \
  } while (false)

#define FIELDMASK_LOG_FATAL(message) \
  FIELDMASK_LOG_IMPL(::fieldmask::log::Level::kFatal, message)
#define FIELDMASK_LOG_ERROR(message) \
  FIELDMASK_LOG_IMPL(::fieldmask::log::Level::kError, message)
#define FIELDMASK_LOG_WARN(message) \
  FIELDMASK_LOG_IMPL(::fieldmask::log::Level::kWarn, message)
#define FIELDMASK_LOG_INFO(message) \
  FIELDMASK_LOG_IMPL(::fieldmask::log::Level::kInfo, message)
#define FIELDMASK_LOG_DEBUG(message) \
  FIELDMASK_LOG_IMPL(::fieldmask::log::Level::kDebug, message)
#define FIELDMASK_LOG_TRACE(message) \
  FIELDMASK_LOG_IMPL(::fieldmask::log::Level::kTrace, message)
