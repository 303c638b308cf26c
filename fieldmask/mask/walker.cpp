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

#include "mask/walker.hpp"

#include <absl/strings/str_cat.h>

#include "error/error.hpp"
#include "utils/assert.hpp"
#include "utils/log.hpp"

namespace fieldmask {

walk_state::composite_scope::composite_scope(walk_state& state,
                                             type_info owner)
  : state_(state), owner_(state.owner_), via_(state.via_) {
  if (state.max_depth_ && state.depth_ >= state.max_depth_) {
    throw depth_limit_error{absl::StrCat(
      "depth limit of ", state.max_depth_, " exceeded while masking '",
      owner.name(), "'", state.owner_ ? " reached through '" : "",
      state.owner_ ? state.owner_.name() : "", state.owner_ ? "'" : "")};
  }

  ++state.stats_.composites;
  ++state.depth_;
  state.via_ = state.owner_;
  state.owner_ = owner;
}

walk_state::composite_scope::~composite_scope() {
  FIELDMASK_ASSERT(state_.depth_ > 0);
  --state_.depth_;
  state_.owner_ = owner_;
  state_.via_ = via_;
}

walk_state::walk_state(const calling_context* context, std::string_view policy,
                       const rule_registry* registry,
                       size_t max_depth) noexcept
  : context_(context),
    registry_(registry),
    policy_(policy),
    max_depth_(max_depth) {}

bool walk_state::match(const member_info& member) const {
  const mask_scope scope{
    .context = context_,
    .owner = owner_,
    .via = via_,
    .policy = policy_,
    .member = member.name(),
    .depth = depth_ - 1,
  };

  for (auto& rule : member.rules()) {
    if (rule->match(scope)) {
      return true;
    }
  }

  if (!registry_) {
    return false;
  }

  auto match_registered = [&](type_info type) {
    for (auto& rule : registry_->find(type.name(), member.name())) {
      if (rule->match(scope)) {
        return true;
      }
    }
    return false;
  };

  // rules registered for a base apply to every composite inheriting it
  if (match_registered(owner_)) {
    return true;
  }
  for (auto base : member.bases()) {
    if (match_registered(base)) {
      return true;
    }
  }

  return false;
}

void walk_state::on_erased(const member_info& member) {
  ++stats_.erased;
  FIELDMASK_LOG_TRACE(absl::StrCat("erased ", to_string(member.kind()), " '",
                                   member.name(), "' of '", owner_.name(),
                                   "' under policy '", policy_, "'"));
}

void walk_state::on_readonly(const member_info& member) {
  ++stats_.readonly_skipped;
  FIELDMASK_LOG_TRACE(absl::StrCat("read-only ", to_string(member.kind()),
                                   " '", member.name(), "' of '",
                                   owner_.name(),
                                   "' matched a rule, left unchanged"));
}

}  // namespace fieldmask
