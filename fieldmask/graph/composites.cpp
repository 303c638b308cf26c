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

#include "graph/composites.hpp"

#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <absl/container/flat_hash_map.h>
#include <absl/strings/str_cat.h>

#include "utils/log.hpp"

namespace fieldmask {
namespace {

struct entry {
  member_table_f table;
  std::string source;
};

class composite_register {
 public:
  static composite_register& instance() {
    static composite_register kInstance;
    return kInstance;
  }

  // returns the previously registered entry on collision
  std::optional<entry> set(std::string_view name, member_table_f table,
                           const char* source) {
    std::lock_guard lock{mutex_};
    auto [it, inserted] = entries_.try_emplace(
      name, entry{table, source ? std::string{source} : std::string{}});
    if (inserted) {
      return std::nullopt;
    }
    return it->second;
  }

  member_table_f get(std::string_view name) const {
    std::lock_guard lock{mutex_};
    auto it = entries_.find(name);
    return it == entries_.end() ? nullptr : it->second.table;
  }

  bool visit(const std::function<bool(std::string_view)>& visitor) const {
    std::vector<std::string> names;
    {
      std::lock_guard lock{mutex_};
      names.reserve(entries_.size());
      for (auto& [name, _] : entries_) {
        names.emplace_back(name);
      }
    }
    for (auto& name : names) {
      if (!visitor(name)) {
        return false;
      }
    }
    return true;
  }

 private:
  mutable std::mutex mutex_;
  absl::flat_hash_map<std::string, entry> entries_;
};

}  // namespace

composite_registrar::composite_registrar(const type_info& type,
                                         member_table_f table,
                                         const char* source) {
  auto previous =
    composite_register::instance().set(type.name(), table, source);
  registered_ = !previous;

  if (registered_) {
    return;
  }

  // the same composite registered twice is not a collision
  if (previous->table == table) {
    return;
  }

  if (source && !previous->source.empty()) {
    FIELDMASK_LOG_WARN(absl::StrCat(
      "type name collision detected while registering composite, "
      "ignoring: type '",
      type.name(), "' from ", source, ", previously from ",
      previous->source));
  } else if (source) {
    FIELDMASK_LOG_WARN(absl::StrCat(
      "type name collision detected while registering composite, "
      "ignoring: type '",
      type.name(), "' from ", source));
  } else {
    FIELDMASK_LOG_WARN(absl::StrCat(
      "type name collision detected while registering composite, "
      "ignoring: type '",
      type.name(), "'"));
  }
}

namespace composites {

bool exists(std::string_view name) {
  return nullptr != composite_register::instance().get(name);
}

const member_table_base* get(std::string_view name) {
  auto table = composite_register::instance().get(name);
  return table ? &table() : nullptr;
}

bool visit(const std::function<bool(std::string_view)>& visitor) {
  return composite_register::instance().visit(visitor);
}

}  // namespace composites
}  // namespace fieldmask
