// Copyright 2025 Jonas Teuwen. All Rights Reserved.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.
#ifndef FOLIO_FOLIOCORE_INCLUDE_FOLIOCORE_STATUS_STATUS_MACROS_H_
#define FOLIO_FOLIOCORE_INCLUDE_FOLIOCORE_STATUS_STATUS_MACROS_H_

#include <string>
#include <string_view>
#include <utility>

#include "absl/status/status.h"
#include "absl/status/statusor.h"

/**
 * @file status_macros.h
 * @brief Traced absl::Status propagation
 *
 * Every hop an error travels through appends one frame of the form
 *
 *     "  at FunctionName (file.cpp:123) [StatusCode] - optional message"
 *
 * to the status message. The root cause stays on the first line, so
 * `StripStackTrace()` gives a one-line summary while the full message is the
 * error chain printed in verbose mode.
 *
 * Coroutines cannot use `return`; the CO_ variants expand to `co_return`.
 */

namespace foliocore::status {

inline constexpr std::string_view kFrameMarker = "\n  at ";

/// @brief Formats a single stack-frame line.
inline std::string FormatStackFrame(char const* function, char const* file,
                                    int line, absl::StatusCode code,
                                    std::string_view message) {
  std::string s = "  at ";
  s.append(function);
  s.append(" (");
  s.append(file);
  s.push_back(':');
  s.append(std::to_string(line));
  s.append(") [");
  s.append(absl::StatusCodeToString(code));
  s.append("]");

  if (!message.empty()) {
    s.append(" - ");
    s.append(message);
  }
  return s;
}

/// @brief Returns the root error text, without any appended frames.
inline std::string StripStackTrace(std::string_view full_message) {
  if (auto pos = full_message.find(kFrameMarker);
      pos != std::string_view::npos) {
    return std::string(full_message.substr(0, pos));
  }
  return std::string(full_message);
}

/// @brief Appends exactly one frame to a non-ok status.
///
/// Payloads attached to the original status (e.g. the HTTP status code of a
/// failed request) are carried over to the returned status.
inline absl::Status AddTrace(absl::Status const& st, char const* function,
                             char const* file, int line,
                             std::string_view message = {}) {
  if (st.ok()) {
    return st;
  }

  std::string out(st.message());
  out.push_back('\n');
  out += FormatStackFrame(function, file, line, st.code(), message);

  absl::Status traced(st.code(), out);
  st.ForEachPayload(
      [&traced](std::string_view type_url, const absl::Cord& payload) {
        traced.SetPayload(type_url, payload);
      });
  return traced;
}

template <typename T>
inline absl::StatusOr<T> AddTrace(absl::StatusOr<T> const& sor,
                                  char const* function, char const* file,
                                  int line, std::string_view message = {}) {
  if (sor.ok()) {
    return sor;
  }
  return AddTrace(sor.status(), function, file, line, message);
}

}  // namespace foliocore::status

//------------------------------------------------------------------------------
// Macros
//------------------------------------------------------------------------------

/// @brief Create a traced absl::Status with an initial frame.
// NOLINTNEXTLINE(cppcoreguidelines-macro-usage)
#define MAKE_STATUS(code, message)                                         \
  ::foliocore::status::AddTrace(absl::Status((code), (message)), __func__, \
                                __FILE__, __LINE__)

/// @brief Propagate a non-ok absl::Status, appending this function as a frame.
// NOLINTNEXTLINE(cppcoreguidelines-macro-usage,cppcoreguidelines-avoid-do-while)
#define RETURN_IF_ERROR(expr, ...)                                            \
  do {                                                                        \
    auto _st = (expr);                                                        \
    if (!_st.ok()) {                                                          \
      return ::foliocore::status::AddTrace(_st, __func__, __FILE__, __LINE__, \
                                           ##__VA_ARGS__);                    \
    }                                                                         \
  } while (0)

/// @brief Unpack a StatusOr<T> into lhs or return on error with a trace.
// NOLINTNEXTLINE(cppcoreguidelines-macro-usage,cppcoreguidelines-avoid-do-while)
#define ASSIGN_OR_RETURN(lhs, expr, ...)                                      \
  do {                                                                        \
    auto _sor = (expr);                                                       \
    if (!_sor.ok()) {                                                         \
      return ::foliocore::status::AddTrace(_sor.status(), __func__, __FILE__, \
                                           __LINE__, ##__VA_ARGS__);          \
    }                                                                         \
    lhs = std::move(_sor).value();                                            \
  } while (0)

/// @brief Declare a variable and unpack a StatusOr<T> into it.
// NOLINTNEXTLINE(cppcoreguidelines-macro-usage)
#define DECLARE_ASSIGN_OR_RETURN(type, name, expr, ...) \
  type name;                                            \
  ASSIGN_OR_RETURN(name, expr, ##__VA_ARGS__)

/// @brief Coroutine flavour of RETURN_IF_ERROR.
///
/// `expr` is evaluated once; it may contain a `co_await`.
// NOLINTNEXTLINE(cppcoreguidelines-macro-usage,cppcoreguidelines-avoid-do-while)
#define CO_RETURN_IF_ERROR(expr, ...)                                  \
  do {                                                                 \
    auto _st = (expr);                                                 \
    if (!_st.ok()) {                                                   \
      co_return ::foliocore::status::AddTrace(_st, __func__, __FILE__, \
                                              __LINE__, ##__VA_ARGS__); \
    }                                                                  \
  } while (0)

/// @brief Coroutine flavour of ASSIGN_OR_RETURN.
// NOLINTNEXTLINE(cppcoreguidelines-macro-usage,cppcoreguidelines-avoid-do-while)
#define CO_ASSIGN_OR_RETURN(lhs, expr, ...)                                 \
  do {                                                                      \
    auto _sor = (expr);                                                     \
    if (!_sor.ok()) {                                                       \
      co_return ::foliocore::status::AddTrace(_sor.status(), __func__,      \
                                              __FILE__, __LINE__,           \
                                              ##__VA_ARGS__);               \
    }                                                                       \
    lhs = std::move(_sor).value();                                          \
  } while (0)

#endif  // FOLIO_FOLIOCORE_INCLUDE_FOLIOCORE_STATUS_STATUS_MACROS_H_
