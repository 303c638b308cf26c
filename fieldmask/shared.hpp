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

#include <cstddef>
#include <cstdint>

#include <absl/base/config.h>

////////////////////////////////////////////////////////////////////////////////
/// C++ standard
////////////////////////////////////////////////////////////////////////////////

#ifndef __cplusplus
#error C++ is required
#endif

#define FIELDMASK_CXX_17 201703L  // c++17
#define FIELDMASK_CXX_20 202002L  // c++20

#if defined(_MSC_VER)
// MSVC doesn't honor __cplusplus macro,
// it always equals to 199711L
// therefore we use _MSC_VER
#if _MSC_VER < 1920  // before MSVC2019
#error "at least C++20 is required"
#endif
#else  // GCC/Clang
#if __cplusplus < FIELDMASK_CXX_20
#error "at least C++20 is required"
#endif
#endif

#define FIELDMASK_CXX FIELDMASK_CXX_20

// std::string_view is passed to abseil hashing and string utilities
#ifndef ABSL_USES_STD_STRING_VIEW
#error "abseil must be built with absl::string_view aliasing std::string_view"
#endif

////////////////////////////////////////////////////////////////////////////////
/// Export/Import definitions
////////////////////////////////////////////////////////////////////////////////

#if defined _MSC_VER || defined __CYGWIN__
#define FIELDMASK_HELPER_DLL_IMPORT __declspec(dllimport)
#define FIELDMASK_HELPER_DLL_EXPORT __declspec(dllexport)
#define FIELDMASK_HELPER_DLL_LOCAL

#define FIELDMASK_FORCE_INLINE inline __forceinline
#define FIELDMASK_NO_INLINE __declspec(noinline)
#else
#define FIELDMASK_HELPER_DLL_IMPORT __attribute__((visibility("default")))
#define FIELDMASK_HELPER_DLL_EXPORT __attribute__((visibility("default")))
#define FIELDMASK_HELPER_DLL_LOCAL __attribute__((visibility("hidden")))

#define FIELDMASK_FORCE_INLINE inline __attribute__((always_inline))
#define FIELDMASK_NO_INLINE __attribute__((noinline))
#endif

// FIELDMASK_API is used for the public API symbols. It either DLL imports or
// DLL exports (or does nothing for static build)
#ifdef FIELDMASK_DLL
#ifdef FIELDMASK_DLL_EXPORTS
#define FIELDMASK_API FIELDMASK_HELPER_DLL_EXPORT
#else
#define FIELDMASK_API FIELDMASK_HELPER_DLL_IMPORT
#endif  // FIELDMASK_DLL_EXPORTS
#else   // FIELDMASK_DLL is not defined: this means FIELDMASK is a static lib.
#define FIELDMASK_API
#endif  // FIELDMASK_DLL

// define function name used for pretty printing
#if defined(__FUNCSIG__) || _MSC_FULL_VER >= 193000000
#define FIELDMASK_CURRENT_FUNCTION __FUNCSIG__
#elif defined(__PRETTY_FUNCTION__) || defined(__GNUC__) || defined(__clang__)
#define FIELDMASK_CURRENT_FUNCTION __PRETTY_FUNCTION__
#else
#error "compiler is not supported"
#endif

// likely/unlikely branch indicator
// macro definitions similar to the ones at
// https://kernelnewbies.org/FAQ/LikelyUnlikely
#if defined(__GNUC__) || defined(__GNUG__)
#define FIELDMASK_LIKELY(v) __builtin_expect(!!(v), 1)
#define FIELDMASK_UNLIKELY(v) __builtin_expect(!!(v), 0)
#else
#define FIELDMASK_LIKELY(v) v
#define FIELDMASK_UNLIKELY(v) v
#endif

#define FIELDMASK_STRINGIFY(x) #x
#define FIELDMASK_TOSTRING(x) FIELDMASK_STRINGIFY(x)
