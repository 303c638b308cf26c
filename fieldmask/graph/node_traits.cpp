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

#include "graph/node_traits.hpp"

namespace fieldmask {

std::string_view to_string(node_kind kind) noexcept {
  switch (kind) {
    case node_kind::kScalar:
      return "scalar";
    case node_kind::kSequence:
      return "sequence";
    case node_kind::kComposite:
      return "composite";
  }

  return "unknown";
}

}  // namespace fieldmask
