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

#ifndef FOLIO_FOLIO_INCLUDE_FOLIO_NET_URL_H_
#define FOLIO_FOLIO_INCLUDE_FOLIO_NET_URL_H_

#include <cstdint>
#include <string>
#include <string_view>

#include "absl/status/statusor.h"

namespace folio {
namespace net {

/// @brief Components of an http(s) URL
struct Url {
  std::string scheme;  ///< "http" or "https" (lower case)
  std::string host;
  uint16_t port = 0;   ///< Explicit port, or the scheme default
  std::string target;  ///< Path and query, always starting with '/'

  [[nodiscard]] bool IsTls() const { return scheme == "https"; }

  /// @brief Host header value (port omitted when it is the default)
  [[nodiscard]] std::string HostHeader() const;

  /// @brief Re-assembled URL
  [[nodiscard]] std::string ToString() const;
};

/// @brief Split "scheme://host[:port][/target]"
///
/// A fragment ("#...") is dropped. Only http and https are accepted.
///
/// @param text Absolute URL
/// @return Parsed URL or kInvalidArgument
absl::StatusOr<Url> ParseUrl(std::string_view text);

/// @brief Resolve a redirect Location header against the request URL
///
/// Handles absolute URLs, scheme-relative ("//host/x"), host-relative
/// ("/x") and path-relative ("x") references.
absl::StatusOr<Url> ResolveLocation(const Url& base, std::string_view location);

/// @brief Last path segment of a URL, without query
///
/// "https://host/iiif/ms-123/manifest.json" -> "manifest.json",
/// "https://host/iiif/" -> "".
std::string LastPathSegment(std::string_view url);

}  // namespace net
}  // namespace folio

#endif  // FOLIO_FOLIO_INCLUDE_FOLIO_NET_URL_H_
