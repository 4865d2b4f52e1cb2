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

#include "folio/net/url.h"

#include <string>
#include <string_view>

#include "absl/status/status.h"
#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "foliocore/status/status_macros.h"

namespace folio {
namespace net {

namespace {

constexpr std::string_view kSchemeSeparator = "://";

uint16_t DefaultPort(std::string_view scheme) {
  return scheme == "https" ? 443 : 80;
}

}  // namespace

std::string Url::HostHeader() const {
  if (port == DefaultPort(scheme)) {
    return host;
  }
  return absl::StrCat(host, ":", port);
}

std::string Url::ToString() const {
  return absl::StrCat(scheme, "://", HostHeader(), target);
}

absl::StatusOr<Url> ParseUrl(std::string_view text) {
  const size_t scheme_end = text.find(kSchemeSeparator);
  if (scheme_end == std::string_view::npos || scheme_end == 0) {
    return MAKE_STATUS(absl::StatusCode::kInvalidArgument,
                       absl::StrFormat("Not an absolute URL: '%s'", text));
  }

  Url url;
  url.scheme = absl::AsciiStrToLower(text.substr(0, scheme_end));
  if (url.scheme != "http" && url.scheme != "https") {
    return MAKE_STATUS(
        absl::StatusCode::kInvalidArgument,
        absl::StrFormat("Unsupported URL scheme '%s'", url.scheme));
  }

  std::string_view rest = text.substr(scheme_end + kSchemeSeparator.size());
  if (const size_t hash = rest.find('#'); hash != std::string_view::npos) {
    rest = rest.substr(0, hash);
  }

  const size_t authority_end = rest.find_first_of("/?");
  std::string_view authority = rest.substr(0, authority_end);
  std::string_view target = authority_end == std::string_view::npos
                                ? std::string_view{}
                                : rest.substr(authority_end);

  if (authority.find('@') != std::string_view::npos) {
    return MAKE_STATUS(absl::StatusCode::kInvalidArgument,
                       "URLs with user info are not supported");
  }

  url.port = DefaultPort(url.scheme);
  if (const size_t colon = authority.rfind(':');
      colon != std::string_view::npos) {
    uint32_t port = 0;
    if (!absl::SimpleAtoi(authority.substr(colon + 1), &port) || port == 0 ||
        port > 65535) {
      return MAKE_STATUS(absl::StatusCode::kInvalidArgument,
                         absl::StrFormat("Invalid port in URL '%s'", text));
    }
    url.port = static_cast<uint16_t>(port);
    authority = authority.substr(0, colon);
  }

  if (authority.empty()) {
    return MAKE_STATUS(absl::StatusCode::kInvalidArgument,
                       absl::StrFormat("URL '%s' has no host", text));
  }
  url.host = std::string(authority);

  if (target.empty()) {
    url.target = "/";
  } else if (target.front() == '?') {
    url.target = absl::StrCat("/", target);
  } else {
    url.target = std::string(target);
  }
  return url;
}

absl::StatusOr<Url> ResolveLocation(const Url& base,
                                    std::string_view location) {
  if (location.empty()) {
    return MAKE_STATUS(absl::StatusCode::kInvalidArgument,
                       "Empty redirect location");
  }
  if (location.find(kSchemeSeparator) != std::string_view::npos) {
    return ParseUrl(location);
  }
  if (absl::StartsWith(location, "//")) {
    return ParseUrl(absl::StrCat(base.scheme, ":", location));
  }

  Url resolved = base;
  if (location.front() == '/') {
    resolved.target = std::string(location);
    return resolved;
  }

  // Path-relative: replace everything after the last '/' of the base path.
  std::string_view base_path = base.target;
  base_path = base_path.substr(0, base_path.find('?'));
  const size_t slash = base_path.rfind('/');
  resolved.target =
      absl::StrCat(base_path.substr(0, slash + 1), location);
  return resolved;
}

std::string LastPathSegment(std::string_view url) {
  std::string_view path = url;
  if (const size_t scheme_end = path.find(kSchemeSeparator);
      scheme_end != std::string_view::npos) {
    path = path.substr(scheme_end + kSchemeSeparator.size());
    const size_t slash = path.find('/');
    path = slash == std::string_view::npos ? std::string_view{}
                                           : path.substr(slash);
  }
  path = path.substr(0, path.find_first_of("?#"));
  const size_t slash = path.rfind('/');
  return std::string(slash == std::string_view::npos ? path
                                                     : path.substr(slash + 1));
}

}  // namespace net
}  // namespace folio
