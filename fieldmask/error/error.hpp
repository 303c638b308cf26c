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

#include <exception>
#include <string>
#include <string_view>

#include "shared.hpp"

namespace fieldmask {

enum class ErrorCode : uint32_t {
  no_error = 0U,
  illegal_argument,
  illegal_state,
  clone_error,
  introspection_error,
  depth_limit_exceeded,
  undefined_error
};

#define FIELDMASK_DECLARE_ERROR_CODE(class_name) \
  static constexpr ErrorCode CODE = ErrorCode::class_name

// ----------------------------------------------------------------------------
//                                                                   error_base
// ----------------------------------------------------------------------------
struct FIELDMASK_API error_base : std::exception {
  virtual ErrorCode code() const noexcept;
  const char* what() const noexcept override;
};

// -----------------------------------------------------------------------------
//                                                           detailed_error_base
// -----------------------------------------------------------------------------
class FIELDMASK_API detailed_error_base : public error_base {
 public:
  detailed_error_base() = default;

  explicit detailed_error_base(std::string&& error) noexcept
    : error_(std::move(error)) {}

  const char* what() const noexcept final { return error_.c_str(); }

 private:
  std::string error_;
};

// ----------------------------------------------------------------------------
//                                                             illegal_argument
// ----------------------------------------------------------------------------
struct FIELDMASK_API illegal_argument : detailed_error_base {
  FIELDMASK_DECLARE_ERROR_CODE(illegal_argument);
  using detailed_error_base::detailed_error_base;
  ErrorCode code() const noexcept override { return CODE; }
};

// ----------------------------------------------------------------------------
//                                                                illegal_state
// ----------------------------------------------------------------------------
struct FIELDMASK_API illegal_state : detailed_error_base {
  FIELDMASK_DECLARE_ERROR_CODE(illegal_state);
  using detailed_error_base::detailed_error_base;
  ErrorCode code() const noexcept override { return CODE; }
};

// ----------------------------------------------------------------------------
//                                                                  clone_error
// ----------------------------------------------------------------------------
// A node of the value graph cannot be duplicated independently
struct FIELDMASK_API clone_error : detailed_error_base {
  FIELDMASK_DECLARE_ERROR_CODE(clone_error);
  using detailed_error_base::detailed_error_base;
  ErrorCode code() const noexcept override { return CODE; }
};

// ----------------------------------------------------------------------------
//                                                          introspection_error
// ----------------------------------------------------------------------------
// A member cannot be read or written
struct FIELDMASK_API introspection_error : detailed_error_base {
  FIELDMASK_DECLARE_ERROR_CODE(introspection_error);
  using detailed_error_base::detailed_error_base;
  ErrorCode code() const noexcept override { return CODE; }
};

// ----------------------------------------------------------------------------
//                                                            depth_limit_error
// ----------------------------------------------------------------------------
struct FIELDMASK_API depth_limit_error : detailed_error_base {
  FIELDMASK_DECLARE_ERROR_CODE(depth_limit_exceeded);
  using detailed_error_base::detailed_error_base;
  ErrorCode code() const noexcept override { return CODE; }
};

}  // namespace fieldmask
